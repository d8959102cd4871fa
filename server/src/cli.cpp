#include <faasbox/server/config.hpp>
#include <faasbox/server/server.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>

void signal_handler(int /*unused*/)
{
  faasbox::server::Server::instance()->shutdown();
}

int main(int argc, char** argv)
{
  faasbox::server::config::Config cfg;
  try {
    cfg = faasbox::server::config::Config::deserialize(argc, argv);
  } catch (std::exception& exc) {
    spdlog::error("Could not load configuration: {}", exc.what());
    return 1;
  }
  cfg.load_env();

  spdlog::set_level(cfg.log_level);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing faasbox server!");

  faasbox::server::Server::configure(cfg);

  // Catch SIGINT and SIGTERM
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);
  sigaction(SIGTERM, &sigIntHandler, nullptr);

  faasbox::server::Server::instance()->run();
  if (!faasbox::server::Server::instance()->wait()) {
    // Remaining tasks would block the destruction of the worker pool.
    spdlog::error("Server is closing down with unfinished requests");
    spdlog::shutdown();
    std::_Exit(1);
  }

  spdlog::info("Server is closing down");
  return 0;
}
