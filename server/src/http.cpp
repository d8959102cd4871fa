#include <faasbox/server/http.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/common/uuid.hpp>
#include <faasbox/pipeline/function.hpp>
#include <faasbox/server/config.hpp>
#include <faasbox/server/workers.hpp>

#include <chrono>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpTypes.h>
#include <drogon/utils/Utilities.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace faasbox::server {

  HttpServer::HttpServer(const config::HTTPServer& cfg, size_t max_file_size, worker::Workers& workers)
      : _port(cfg.port), _threads(cfg.threads), _workers(workers)
  {
    _logger = common::util::create_logger("HttpServer");
    // Oversized archives are rejected by the pipeline, not by the framework.
    drogon::app().setClientMaxBodySize(max_file_size + FORM_OVERHEAD);
    drogon::app().setClientMaxMemoryBodySize(max_file_size + FORM_OVERHEAD);
    drogon::app().setIdleConnectionTimeout(
        static_cast<size_t>(cfg.idle_connection_timeout().count())
    );
  }

  void HttpServer::run()
  {
    drogon::app().disableSigtermHandling();
    drogon::app().registerController(shared_from_this());
    drogon::app().setThreadNum(_threads);
    _register_advices();

    _logger->info("Starting HTTP server on port {}", _port);
    _server_thread = std::thread{[this]() { drogon::app().addListener("0.0.0.0", _port).run(); }};
  }

  void HttpServer::shutdown()
  {
    _logger->info("Stopping HTTP server");
    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
  }

  void HttpServer::wait()
  {
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _logger->info("Stopped HTTP server");
  }

  void HttpServer::_register_advices()
  {
    // Every request receives an identifier, reusing the one sent by the client.
    drogon::app().registerPreRoutingAdvice([](const drogon::HttpRequestPtr& request) {
      static common::UUID generator;

      std::string id = request->getHeader(REQUEST_ID_HEADER);
      if (id.empty()) {
        id = generator.generate_str();
      }
      request->attributes()->insert(REQUEST_ID_ATTRIBUTE, id);
      request->attributes()->insert(REQUEST_START_ATTRIBUTE, std::chrono::steady_clock::now());
    });

    drogon::app().registerPostHandlingAdvice(
        [this](const drogon::HttpRequestPtr& request, const drogon::HttpResponsePtr& response) {
          std::string id = request_id(request);
          response->addHeader(REQUEST_ID_HEADER, id);

          auto attributes = request->attributes();
          long duration = 0;
          if (attributes->find(REQUEST_START_ATTRIBUTE)) {
            auto start =
                attributes->get<std::chrono::steady_clock::time_point>(REQUEST_START_ATTRIBUTE);
            duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start
            )
                           .count();
          }

          _logger->info(
              "[{}] {} {} {} from {} in {} ms", id, request->getMethodString(), request->getPath(),
              static_cast<int>(response->getStatusCode()), request->getPeerAddr().toIp(), duration
          );
        }
    );

    drogon::app().setExceptionHandler(
        [this](
            const std::exception& exc, const drogon::HttpRequestPtr& request,
            std::function<void(const drogon::HttpResponsePtr&)>&& callback
        ) {
          std::string id = request_id(request);
          _logger->error("[{}] Unhandled exception in {}: {}", id, request->getPath(), exc.what());

          auto resp = failed_response("Internal server error");
          resp->addHeader(REQUEST_ID_HEADER, id);
          callback(resp);
        }
    );
  }

  std::string HttpServer::request_id(const request_t& request)
  {
    auto attributes = request->attributes();
    if (attributes->find(REQUEST_ID_ATTRIBUTE)) {
      return attributes->get<std::string>(REQUEST_ID_ATTRIBUTE);
    }
    return "";
  }

  drogon::HttpResponsePtr HttpServer::correct_response(const std::string& message)
  {
    Json::Value json;
    json["message"] = message;
    return correct_response(json);
  }

  drogon::HttpResponsePtr HttpServer::correct_response(const Json::Value& body)
  {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(drogon::k200OK);
    return resp;
  }

  drogon::HttpResponsePtr HttpServer::failed_response(
      const std::string& reason, drogon::HttpStatusCode status_code, const std::string& details
  )
  {
    Json::Value json;
    json["error"] = reason;
    json["code"] = static_cast<int>(status_code);
    if (!details.empty()) {
      json["details"] = details;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(status_code);
    return resp;
  }

  drogon::HttpResponsePtr HttpServer::exception_response(const std::exception_ptr& exc)
  {
    try {
      std::rethrow_exception(exc);
    } catch (common::UploadTooLarge& err) {
      return failed_response("File too large", drogon::k400BadRequest, err.what());
    } catch (common::NoHandlerFound& err) {
      return failed_response("No handler found", drogon::k400BadRequest, err.what());
    } catch (common::UnsupportedLanguage& err) {
      return failed_response("Unsupported language", drogon::k400BadRequest, err.what());
    } catch (common::ClientInputError& err) {
      return failed_response("Invalid request", drogon::k400BadRequest, err.what());
    } catch (common::ObjectDoesNotExist& err) {
      return failed_response("Function not found", drogon::k404NotFound, err.what());
    } catch (common::TimeoutError& err) {
      return failed_response("Timeout", drogon::k504GatewayTimeout, err.what());
    } catch (common::BuildFailed& err) {
      return failed_response(
          "Failed to build image", drogon::k500InternalServerError,
          fmt::format("{}\n{}", err.what(), err.output())
      );
    } catch (common::ExecutionFailed& err) {
      return failed_response(
          "Function execution failed", drogon::k500InternalServerError,
          fmt::format("{}\n{}", err.what(), err.output())
      );
    } catch (common::ResourceError& err) {
      return failed_response("Internal server error", drogon::k500InternalServerError, err.what());
    } catch (std::exception& err) {
      spdlog::error("Unexpected failure: {}", err.what());
      return failed_response("Internal server error");
    }
  }

  Json::Value HttpServer::to_json(const pipeline::FunctionMetadata& metadata)
  {
    Json::Value json;
    json["functionId"] = metadata.function_id;
    json["imageId"] = metadata.image_id;
    json["language"] = pipeline::language_to_string(metadata.language);
    json["createdAt"] = static_cast<Json::Int64>(metadata.created_at);
    if (metadata.last_executed.has_value()) {
      json["lastExecuted"] = static_cast<Json::Int64>(metadata.last_executed.value());
    }
    json["name"] = metadata.name;
    return json;
  }

  void HttpServer::submit(const request_t& request, callback_t&& callback)
  {
    std::string id = request_id(request);

    drogon::MultiPartParser parser;
    if (parser.parse(request) != 0) {
      _logger->warn("[{}] Failed to parse multipart form", id);
      callback(failed_response(
          "Invalid request", drogon::k400BadRequest, "expected a multipart/form-data body"
      ));
      return;
    }

    const drogon::HttpFile* code = nullptr;
    for (const auto& file : parser.getFiles()) {
      if (file.getItemName() == CODE_ITEM) {
        code = &file;
        break;
      }
    }
    if (code == nullptr) {
      _logger->warn("[{}] Missing code file", id);
      callback(failed_response(
          "Missing code file", drogon::k400BadRequest, "the 'code' form field is required"
      ));
      return;
    }

    std::string name;
    const auto& params = parser.getParameters();
    if (auto it = params.find(NAME_ITEM); it != params.end()) {
      name = it->second;
    }

    _logger->info(
        "[{}] Received function upload {}, {} bytes", id, code->getFileName(), code->fileLength()
    );
    // The request owns the uploaded bytes referenced by the file.
    _workers.add_task(
        &worker::Workers::handle_submit, request, std::move(callback), *code, std::move(name),
        std::move(id)
    );
  }

  void HttpServer::execute_get(const request_t& request, callback_t&& callback)
  {
    std::string function_id = request->getParameter("functionId");
    if (function_id.empty()) {
      callback(failed_response(
          "Missing function ID", drogon::k400BadRequest,
          "The 'functionId' query parameter is required"
      ));
      return;
    }

    _workers.add_task(
        &worker::Workers::handle_execute, std::move(callback), std::move(function_id),
        pipeline::ExecutionInput{}, request_id(request)
    );
  }

  void HttpServer::execute_post(const request_t& request, callback_t&& callback)
  {
    auto json = request->getJsonObject();
    if (!json || !json->isObject()) {
      std::string error = request->getJsonError();
      callback(failed_response(
          "Invalid request body", drogon::k400BadRequest,
          error.empty() ? "expected a JSON object" : error
      ));
      return;
    }

    if (!json->isMember("functionId") || !(*json)["functionId"].isString() ||
        (*json)["functionId"].asString().empty()) {
      callback(failed_response(
          "Missing function ID", drogon::k400BadRequest, "The 'functionId' field is required"
      ));
      return;
    }
    std::string function_id = (*json)["functionId"].asString();

    pipeline::ExecutionInput input;
    if (json->isMember("input") && !(*json)["input"].isNull()) {

      const Json::Value& values = (*json)["input"];
      if (!values.isObject()) {
        callback(failed_response(
            "Invalid request body", drogon::k400BadRequest, "'input' must be an object"
        ));
        return;
      }

      for (const auto& key : values.getMemberNames()) {
        if (key.empty()) {
          callback(failed_response(
              "Invalid request body", drogon::k400BadRequest, "input names must not be empty"
          ));
          return;
        }
        if (!values[key].isString()) {
          callback(failed_response(
              "Invalid request body", drogon::k400BadRequest,
              fmt::format("value of input '{}' must be a string", key)
          ));
          return;
        }
        input[key] = values[key].asString();
      }
    }

    _workers.add_task(
        &worker::Workers::handle_execute, std::move(callback), std::move(function_id),
        std::move(input), request_id(request)
    );
  }

  void HttpServer::list_functions(const request_t& request, callback_t&& callback)
  {
    _workers.add_task(&worker::Workers::handle_list, std::move(callback), request_id(request));
  }

  void HttpServer::get_function(
      const request_t& request, callback_t&& callback, const std::string& function_id
  )
  {
    _workers.add_task(
        &worker::Workers::handle_get, std::move(callback), function_id, request_id(request)
    );
  }

  void HttpServer::delete_function(
      const request_t& request, callback_t&& callback, const std::string& function_id
  )
  {
    _workers.add_task(
        &worker::Workers::handle_delete, std::move(callback), function_id, request_id(request)
    );
  }

  void HttpServer::health(const request_t&, callback_t&& callback)
  {
    Json::Value json;
    json["status"] = "ok";
    json["time"] = common::util::rfc3339_now();
    callback(correct_response(json));
  }

} // namespace faasbox::server
