#ifndef FAASBOX_SERVER_WORKERS_HPP
#define FAASBOX_SERVER_WORKERS_HPP

#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/function.hpp>
#include <faasbox/server/config.hpp>
#include <faasbox/server/http.hpp>

#include <BS_thread_pool.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace faasbox::pipeline {
  class Pipeline;
} // namespace faasbox::pipeline

namespace faasbox::server::worker {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Runs pipeline operations on a fixed pool of threads.
  ///
  /// Every handler answers through the callback exactly once. Exceptions never
  /// leave a task; they are converted into error responses.
  ////////////////////////////////////////////////////////////////////////////////
  class Workers {
  public:
    Workers(const config::Workers& config, pipeline::Pipeline& pipeline)
        : _pool(config.threads), _pipeline(pipeline)
    {
      _logger = common::util::create_logger("Workers");
    }

    template <typename F, typename... Args>
    void add_task(F&& func, Args&&... args)
    {
      _pool.detach_task([this, func, ... args = std::forward<Args>(args)]() mutable {
        std::invoke(func, *this, std::forward<Args>(args)...);
      });
    }

    void handle_submit(
        HttpServer::request_t request, HttpServer::callback_t&& callback, drogon::HttpFile file,
        std::string name, std::string request_id
    );

    void handle_execute(
        HttpServer::callback_t&& callback, std::string function_id,
        pipeline::ExecutionInput input, std::string request_id
    );

    void handle_list(HttpServer::callback_t&& callback, std::string request_id);

    void handle_get(
        HttpServer::callback_t&& callback, std::string function_id, std::string request_id
    );

    void handle_delete(
        HttpServer::callback_t&& callback, std::string function_id, std::string request_id
    );

    // Blocks until all queued tasks finish.
    void wait()
    {
      _pool.wait();
    }

    // Returns false if tasks are still running when the timeout expires.
    bool wait_for(std::chrono::milliseconds timeout)
    {
      return _pool.wait_for(timeout);
    }

  private:
    void _fail(
        const HttpServer::callback_t& callback, const std::string& request_id,
        const std::exception_ptr& exc
    );

    BS::thread_pool _pool;

    pipeline::Pipeline& _pipeline;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::server::worker

#endif
