#ifndef FAASBOX_SERVER_SERVER_HPP
#define FAASBOX_SERVER_SERVER_HPP

#include <faasbox/pipeline/builder.hpp>
#include <faasbox/pipeline/pipeline.hpp>
#include <faasbox/pipeline/registry.hpp>
#include <faasbox/pipeline/sandbox.hpp>
#include <faasbox/server/config.hpp>
#include <faasbox/server/http.hpp>
#include <faasbox/server/workers.hpp>

#include <atomic>
#include <chrono>
#include <memory>

#include <spdlog/spdlog.h>

namespace faasbox::server {

  struct Server {

    void run();

    // Stops accepting requests; called from the signal handler.
    void shutdown();

    // Returns false if the workers did not drain within the shutdown timeout.
    bool wait();

    int http_port() const
    {
      return _http_server->port();
    }

    static void configure(const config::Config& cfg)
    {
      _instance.reset(new Server{cfg});
    }

    static Server* instance()
    {
      return _instance.get();
    }

  private:
    static std::shared_ptr<Server> _instance;

    Server(const config::Config& cfg);

    std::shared_ptr<spdlog::logger> _logger;

    bool _prune_on_shutdown;
    std::chrono::milliseconds _shutdown_timeout;
    std::atomic<bool> _shutdown{false};

    pipeline::DockerImageBuilder _builder;

    pipeline::DockerSandboxRunner _runner;

    pipeline::FunctionTable _registry;

    pipeline::Pipeline _pipeline;

    worker::Workers _workers;

    // Shared pointer is required by drogon
    std::shared_ptr<HttpServer> _http_server;
  };

} // namespace faasbox::server

#endif
