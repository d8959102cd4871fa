#ifndef FAASBOX_COMMON_HTTP_HPP
#define FAASBOX_COMMON_HTTP_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace drogon {
  struct HttpRequest;
  struct HttpResponse;
  enum class ReqResult;
  struct HttpClient;
} // namespace drogon

namespace trantor {
  struct EventLoop;
  struct EventLoopThreadPool;
} // namespace trantor

namespace Json {
  struct Value;
} // namespace Json

namespace faasbox::common::http {

  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using response_ptr_t = std::shared_ptr<drogon::HttpResponse>;
    using parameters_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t =
        std::function<void(drogon::ReqResult, const std::shared_ptr<drogon::HttpResponse>&)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop);

    request_ptr_t get(const std::string& path, parameters_t&& params, callback_t&& callback);

    request_ptr_t del(const std::string& path, callback_t&& callback);

    request_ptr_t
    post(const std::string& path, parameters_t&& params, Json::Value&& body, callback_t&& callback);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Sends a multipart/form-data request with one file item and
    /// optional form parameters.
    ///
    /// @param[in] path request path
    /// @param[in] item form item name of the file
    /// @param[in] file_path local file to upload
    /// @param[in] params additional form fields
    /// @param[in] callback invoked with the response
    ////////////////////////////////////////////////////////////////////////////////
    request_ptr_t upload(
        const std::string& path, const std::string& item, const std::string& file_path,
        parameters_t&& params, callback_t&& callback
    );

  private:
    void request(request_ptr_t& req, parameters_t&& params, callback_t&& callback);

    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    static HTTPClient create_client(std::string address, int port = -1);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace faasbox::common::http

#endif
