#include <faasbox/server/config.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace faasbox::server::config {

  static std::optional<std::string> env_value(const char* name)
  {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string{value};
  }

  static std::optional<long> env_number(const char* name)
  {
    auto value = env_value(name);
    if (!value.has_value()) {
      return std::nullopt;
    }

    try {
      size_t pos = 0;
      long result = std::stol(value.value(), &pos);
      if (pos == value->length() && result > 0) {
        return result;
      }
    } catch (std::logic_error&) {
    }
    spdlog::warn("Ignoring invalid value of {}: {}", name, value.value());
    return std::nullopt;
  }

  static std::optional<std::chrono::milliseconds> env_duration(const char* name)
  {
    auto value = env_value(name);
    if (!value.has_value()) {
      return std::nullopt;
    }

    auto duration = common::util::parse_duration(value.value());
    if (!duration.has_value() || duration->count() == 0) {
      spdlog::warn("Ignoring invalid duration of {}: {}", name, value.value());
      return std::nullopt;
    }
    return duration;
  }

  static std::chrono::milliseconds load_duration(const std::string& name, const std::string& value)
  {
    auto duration = common::util::parse_duration(value);
    if (!duration.has_value() || duration->count() == 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Invalid duration of {}: {}", name, value)};
    }
    return duration.value();
  }

  void HTTPServer::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(port));
    archive(CEREAL_NVP(threads));

    std::string read_timeout;
    std::string write_timeout;
    std::string shutdown_timeout;
    archive(CEREAL_NVP(read_timeout));
    archive(CEREAL_NVP(write_timeout));
    archive(CEREAL_NVP(shutdown_timeout));
    this->read_timeout = load_duration("read_timeout", read_timeout);
    this->write_timeout = load_duration("write_timeout", write_timeout);
    this->shutdown_timeout = load_duration("shutdown_timeout", shutdown_timeout);
  }

  void HTTPServer::set_defaults()
  {
    port = DEFAULT_PORT;
    threads = DEFAULT_THREADS_NUMBER;
    read_timeout = DEFAULT_READ_TIMEOUT;
    write_timeout = DEFAULT_WRITE_TIMEOUT;
    shutdown_timeout = DEFAULT_SHUTDOWN_TIMEOUT;
  }

  std::chrono::seconds HTTPServer::idle_connection_timeout() const
  {
    return std::chrono::ceil<std::chrono::seconds>(std::max(read_timeout, write_timeout));
  }

  void HTTPServer::load_env()
  {
    if (auto value = env_number("SERVER_PORT"); value.has_value()) {
      if (value.value() > 65535) {
        spdlog::warn("Ignoring invalid value of SERVER_PORT: {}", value.value());
      } else {
        port = static_cast<int>(value.value());
      }
    }
    if (auto value = env_duration("SERVER_READ_TIMEOUT"); value.has_value()) {
      read_timeout = value.value();
    }
    if (auto value = env_duration("SERVER_WRITE_TIMEOUT"); value.has_value()) {
      write_timeout = value.value();
    }
    if (auto value = env_duration("SERVER_SHUTDOWN_TIMEOUT"); value.has_value()) {
      shutdown_timeout = value.value();
    }
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Files::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(max_file_size));
    archive(CEREAL_NVP(temp_dir_base));
  }

  void Files::set_defaults()
  {
    max_file_size = DEFAULT_MAX_FILE_SIZE;
    temp_dir_base = "";
  }

  void Files::load_env()
  {
    if (auto value = env_number("MAX_FILE_SIZE"); value.has_value()) {
      max_file_size = static_cast<size_t>(value.value());
    }
    if (auto value = env_value("TEMP_DIR_BASE"); value.has_value()) {
      temp_dir_base = value.value();
    }
  }

  void Docker::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(binary));
    archive(CEREAL_NVP(image_prefix));
    archive(CEREAL_NVP(templates));

    std::string build_timeout;
    std::string run_timeout;
    archive(CEREAL_NVP(build_timeout));
    archive(CEREAL_NVP(run_timeout));
    this->build_timeout = load_duration("build_timeout", build_timeout);
    this->run_timeout = load_duration("run_timeout", run_timeout);

    archive(CEREAL_NVP(prune_on_shutdown));
  }

  void Docker::set_defaults()
  {
    binary = DEFAULT_BINARY;
    image_prefix = DEFAULT_IMAGE_PREFIX;
    templates = DEFAULT_TEMPLATES;
    build_timeout = DEFAULT_BUILD_TIMEOUT;
    run_timeout = DEFAULT_RUN_TIMEOUT;
    prune_on_shutdown = false;
  }

  void Docker::load_env()
  {
    if (auto value = env_value("DOCKER_BINARY"); value.has_value()) {
      binary = value.value();
    }
    if (auto value = env_value("DOCKER_IMAGE_PREFIX"); value.has_value()) {
      image_prefix = value.value();
    }
    if (auto value = env_value("TEMPLATES_DIR"); value.has_value()) {
      templates = value.value();
    }
    if (auto value = env_duration("DOCKER_BUILD_TIMEOUT"); value.has_value()) {
      build_timeout = value.value();
    }
    if (auto value = env_duration("DOCKER_RUN_TIMEOUT"); value.has_value()) {
      run_timeout = value.value();
    }
  }

  void Config::set_defaults()
  {
    verbose = false;
    log_level = spdlog::level::info;

    http.set_defaults();
    workers.set_defaults();
    files.set_defaults();
    docker.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(verbose));
    log_level = verbose ? spdlog::level::debug : spdlog::level::info;

    common::util::cereal_load_optional(archive, "http", this->http);
    common::util::cereal_load_optional(archive, "workers", this->workers);
    common::util::cereal_load_optional(archive, "files", this->files);
    common::util::cereal_load_optional(archive, "docker", this->docker);
  }

  void Config::load_env()
  {
    if (auto value = env_value("LOG_LEVEL"); value.has_value()) {
      if (value.value() == "debug") {
        verbose = true;
        log_level = spdlog::level::debug;
      } else if (value.value() == "info") {
        verbose = false;
        log_level = spdlog::level::info;
      } else if (value.value() == "warn") {
        verbose = false;
        log_level = spdlog::level::warn;
      } else if (value.value() == "error") {
        verbose = false;
        log_level = spdlog::level::err;
      } else {
        spdlog::warn("Ignoring unknown log level {}", value.value());
      }
    }

    http.load_env();
    files.load_env();
    docker.load_env();
  }

  pipeline::Options Config::pipeline_options() const
  {
    return pipeline::Options{
        files.temp_dir_base, files.max_file_size, docker.build_timeout, docker.run_timeout};
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    try {
      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse configuration, reason: {}", exc.what())};
    }
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("faasbox", "Builds and runs serverless functions in containers.");
    options.add_options(
    )("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""));
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Config cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError{
            fmt::format("Could not open config file {}", config_file)};
      }
      cfg = deserialize(in_stream);
    }

    return cfg;
  }

} // namespace faasbox::server::config
