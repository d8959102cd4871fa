#include <faasbox/common/http.hpp>

#include <faasbox/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/UploadFile.h>
#include <fmt/format.h>
#include <json/value.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace faasbox::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  HTTPClient::HTTPClient() : _http_client(nullptr) {}

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop)
  {
    this->_http_client = drogon::HttpClient::newHttpClient(address, loop, false, false);
  }

  std::shared_ptr<drogon::HttpRequest>
  HTTPClient::get(const std::string& path, parameters_t&& params, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(path);
    request(req, std::forward<parameters_t>(params), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::del(const std::string& path, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Delete);
    req->setPath(path);
    request(req, {}, std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post(
      const std::string& path, parameters_t&& params, Json::Value&& body, callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpJsonRequest(body);
    req->setMethod(drogon::Post);
    req->setPath(path);
    request(req, std::forward<parameters_t>(params), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::upload(
      const std::string& path, const std::string& item, const std::string& file_path,
      parameters_t&& params, callback_t&& callback
  )
  {
    std::vector<drogon::UploadFile> files;
    files.emplace_back(file_path, "", item);

    auto req = drogon::HttpRequest::newFileUploadRequest(files);
    req->setMethod(drogon::Post);
    req->setPath(path);
    // Form fields of a multipart request are sent as parameters.
    request(req, std::forward<parameters_t>(params), std::forward<callback_t>(callback));

    return req;
  }

  void HTTPClient::request(
      std::shared_ptr<drogon::HttpRequest>& req, parameters_t&& params, callback_t&& callback
  )
  {
    for (const auto& param : params) {
      req->setParameter(param.first, param.second);
    }
    _http_client->sendRequest(req, callback);
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    HTTPClientFactory::_pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    HTTPClientFactory::_pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    HTTPClientFactory::_pool.reset();
  }

  HTTPClient HTTPClientFactory::create_client(std::string address, int port)
  {
    if (!_pool) {
      throw common::FaasboxException("Uninitialized HTTPClientFactory!");
    }

    if (port != -1) {
      return HTTPClient{fmt::format("{}:{}", address, port), _pool->getNextLoop()};
    } else {
      return HTTPClient{address, _pool->getNextLoop()};
    }
  }

} // namespace faasbox::common::http
