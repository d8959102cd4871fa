#ifndef FAASBOX_SERVER_HTTP_HPP
#define FAASBOX_SERVER_HTTP_HPP

#include <exception>
#include <memory>
#include <string>
#include <thread>

#include <drogon/HttpTypes.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

namespace faasbox::pipeline {
  struct FunctionMetadata;
} // namespace faasbox::pipeline

namespace faasbox::server {

  namespace worker {
    class Workers;
  } // namespace worker

  namespace config {
    struct HTTPServer;
  } // namespace config

  struct HttpServer : public drogon::HttpController<HttpServer, false>,
                      std::enable_shared_from_this<HttpServer> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    static constexpr char REQUEST_ID_HEADER[] = "X-Request-ID";
    static constexpr char REQUEST_ID_ATTRIBUTE[] = "request_id";
    static constexpr char REQUEST_START_ATTRIBUTE[] = "request_start";
    static constexpr char CODE_ITEM[] = "code";
    static constexpr char NAME_ITEM[] = "name";
    // Multipart framing on top of the archive itself.
    static constexpr size_t FORM_OVERHEAD = 1024 * 1024;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HttpServer::submit, "/api/submit", drogon::Post);
    ADD_METHOD_TO(HttpServer::execute_get, "/api/execute", drogon::Get);
    ADD_METHOD_TO(HttpServer::execute_post, "/api/execute", drogon::Post);
    ADD_METHOD_TO(HttpServer::list_functions, "/api/functions", drogon::Get);
    ADD_METHOD_TO(HttpServer::get_function, "/api/functions/{1}", drogon::Get);
    ADD_METHOD_TO(HttpServer::delete_function, "/api/functions/{1}", drogon::Delete);
    ADD_METHOD_TO(HttpServer::health, "/health", drogon::Get);
    METHOD_LIST_END

    HttpServer(const config::HTTPServer& cfg, size_t max_file_size, worker::Workers& workers);

    void run();
    void shutdown();
    void wait();

    void submit(const request_t& request, callback_t&& callback);

    void execute_get(const request_t& request, callback_t&& callback);

    void execute_post(const request_t& request, callback_t&& callback);

    void list_functions(const request_t& request, callback_t&& callback);

    void get_function(
        const request_t& request, callback_t&& callback, const std::string& function_id
    );

    void delete_function(
        const request_t& request, callback_t&& callback, const std::string& function_id
    );

    void health(const request_t& request, callback_t&& callback);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Error body {error, code, details}; details are omitted when empty.
    ////////////////////////////////////////////////////////////////////////////////
    static drogon::HttpResponsePtr failed_response(
        const std::string& reason, drogon::HttpStatusCode code = drogon::k500InternalServerError,
        const std::string& details = ""
    );
    static drogon::HttpResponsePtr correct_response(const std::string& message);
    static drogon::HttpResponsePtr correct_response(const Json::Value& body);

    // Maps an exception of a request handler onto an error response.
    static drogon::HttpResponsePtr exception_response(const std::exception_ptr& exc);

    static Json::Value to_json(const pipeline::FunctionMetadata& metadata);

    static std::string request_id(const request_t& request);

    int port() const
    {
      return _port;
    }

  private:
    void _register_advices();

    int _port;

    int _threads;

    worker::Workers& _workers;

    std::shared_ptr<spdlog::logger> _logger;
    std::thread _server_thread;
  };
} // namespace faasbox::server

#endif
