#include <faasbox/server/server.hpp>

#include <faasbox/common/util.hpp>

namespace faasbox::server {

  std::shared_ptr<Server> Server::_instance = nullptr;

  Server::Server(const config::Config& cfg)
      : _prune_on_shutdown(cfg.docker.prune_on_shutdown),
        _shutdown_timeout(cfg.http.shutdown_timeout),
        _builder(cfg.docker.binary, cfg.docker.image_prefix, cfg.docker.templates),
        _runner(cfg.docker.binary),
        _pipeline(cfg.pipeline_options(), _builder, _runner, _registry),
        _workers(cfg.workers, _pipeline),
        _http_server(std::make_shared<HttpServer>(cfg.http, cfg.files.max_file_size, _workers))
  {
    _logger = common::util::create_logger("Server");
    if (cfg.http.write_timeout <= cfg.docker.build_timeout) {
      _logger->warn(
          "HTTP write timeout {} does not exceed the build timeout {}, slow submissions will be "
          "disconnected",
          common::util::format_duration(cfg.http.write_timeout),
          common::util::format_duration(cfg.docker.build_timeout)
      );
    }
    _logger->info(
        "Configured with {} workers, build timeout {}, run timeout {}", cfg.workers.threads,
        common::util::format_duration(cfg.docker.build_timeout),
        common::util::format_duration(cfg.docker.run_timeout)
    );
  }

  void Server::run()
  {
    _http_server->run();
  }

  bool Server::wait()
  {
    _http_server->wait();

    // Stopping containers releases the workers blocked on them.
    _runner.shutdown();
    bool drained = _workers.wait_for(_shutdown_timeout);
    if (!drained) {
      _logger->warn(
          "Workers did not finish within {}", common::util::format_duration(_shutdown_timeout)
      );
    }

    if (_prune_on_shutdown) {
      _builder.prune();
    }
    return drained;
  }

  void Server::shutdown()
  {
    if (_shutdown.exchange(true)) {
      return;
    }

    _http_server->shutdown();
  }

} // namespace faasbox::server
