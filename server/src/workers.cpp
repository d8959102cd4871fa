#include <faasbox/server/workers.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/pipeline/pipeline.hpp>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <fmt/format.h>

namespace faasbox::server::worker {

  void Workers::handle_submit(
      HttpServer::request_t request, HttpServer::callback_t&& callback, drogon::HttpFile file,
      std::string name, std::string request_id
  )
  {
    try {

      boost::iostreams::stream<boost::iostreams::array_source> upload(
          file.fileData(), file.fileLength()
      );
      auto metadata = _pipeline.submit(file.getFileName(), upload, name, request_id);

      Json::Value json;
      json["functionId"] = metadata.function_id;
      json["imageId"] = metadata.image_id;
      json["message"] = fmt::format("Function '{}' deployed successfully", metadata.name);
      callback(HttpServer::correct_response(json));

    } catch (std::exception&) {
      _fail(callback, request_id, std::current_exception());
    }
  }

  void Workers::handle_execute(
      HttpServer::callback_t&& callback, std::string function_id, pipeline::ExecutionInput input,
      std::string request_id
  )
  {
    try {

      auto result = _pipeline.execute(function_id, input, request_id);

      Json::Value json;
      json["output"] = result.output;
      json["statusCode"] = static_cast<int>(drogon::k200OK);
      json["executedAt"] = static_cast<Json::Int64>(result.executed_at);
      callback(HttpServer::correct_response(json));

    } catch (std::exception&) {
      _fail(callback, request_id, std::current_exception());
    }
  }

  void Workers::handle_list(HttpServer::callback_t&& callback, std::string request_id)
  {
    try {

      auto functions = _pipeline.list();

      Json::Value json{Json::arrayValue};
      for (const auto& metadata : functions) {
        json.append(HttpServer::to_json(metadata));
      }
      _logger->info("[{}] Listed {} functions", request_id, functions.size());
      callback(HttpServer::correct_response(json));

    } catch (std::exception&) {
      _fail(callback, request_id, std::current_exception());
    }
  }

  void Workers::handle_get(
      HttpServer::callback_t&& callback, std::string function_id, std::string request_id
  )
  {
    try {
      callback(HttpServer::correct_response(HttpServer::to_json(_pipeline.get(function_id))));
    } catch (std::exception&) {
      _fail(callback, request_id, std::current_exception());
    }
  }

  void Workers::handle_delete(
      HttpServer::callback_t&& callback, std::string function_id, std::string request_id
  )
  {
    try {
      _pipeline.remove(function_id, request_id);
      callback(
          HttpServer::correct_response(fmt::format("Function {} deleted successfully", function_id))
      );
    } catch (std::exception&) {
      _fail(callback, request_id, std::current_exception());
    }
  }

  void Workers::_fail(
      const HttpServer::callback_t& callback, const std::string& request_id,
      const std::exception_ptr& exc
  )
  {
    auto response = HttpServer::exception_response(exc);
    _logger->error(
        "[{}] Request failed with status {}: {}", request_id,
        static_cast<int>(response->getStatusCode()), response->getBody()
    );
    callback(response);
  }

} // namespace faasbox::server::worker
