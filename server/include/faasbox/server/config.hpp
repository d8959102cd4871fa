#ifndef FAASBOX_SERVER_CONFIG_HPP
#define FAASBOX_SERVER_CONFIG_HPP

#include <faasbox/pipeline/pipeline.hpp>

#include <chrono>
#include <istream>
#include <string>

#include <cereal/archives/json.hpp>
#include <spdlog/common.h>

namespace cereal {
  struct JSONInputArchive;
} // namespace cereal

namespace faasbox::server::config {

  struct HTTPServer {

    static constexpr int DEFAULT_THREADS_NUMBER = 1;
    static constexpr int DEFAULT_PORT = 8080;
    static constexpr std::chrono::seconds DEFAULT_READ_TIMEOUT{10};
    // Must outlast the build deadline; drogon closes connections idle for longer.
    static constexpr std::chrono::seconds DEFAULT_WRITE_TIMEOUT{150};
    static constexpr std::chrono::seconds DEFAULT_SHUTDOWN_TIMEOUT{5};

    HTTPServer()
    {
      set_defaults();
    }

    int port;
    int threads;
    std::chrono::milliseconds read_timeout;
    std::chrono::milliseconds write_timeout;
    // Bound on draining the workers after the listener stops.
    std::chrono::milliseconds shutdown_timeout;

    // Drogon has a single timer covering reads and writes of a connection.
    std::chrono::seconds idle_connection_timeout() const;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void load_env();
  };

  struct Workers {
    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    Workers()
    {
      set_defaults();
    }

    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Files {
    // 10 MiB
    static constexpr size_t DEFAULT_MAX_FILE_SIZE = 10 * 1024 * 1024;

    Files()
    {
      set_defaults();
    }

    size_t max_file_size;
    // Empty selects the system temporary directory.
    std::string temp_dir_base;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void load_env();
  };

  struct Docker {
    static constexpr char DEFAULT_BINARY[] = "docker";
    static constexpr char DEFAULT_IMAGE_PREFIX[] = "faasbox";
    static constexpr char DEFAULT_TEMPLATES[] = "templates";
    static constexpr std::chrono::seconds DEFAULT_BUILD_TIMEOUT{120};
    static constexpr std::chrono::seconds DEFAULT_RUN_TIMEOUT{30};

    Docker()
    {
      set_defaults();
    }

    std::string binary;
    std::string image_prefix;
    std::string templates;
    std::chrono::milliseconds build_timeout;
    std::chrono::milliseconds run_timeout;
    bool prune_on_shutdown;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void load_env();
  };

  struct Config {

    HTTPServer http;
    Workers workers;
    Files files;
    Docker docker;

    bool verbose;

    spdlog::level::level_enum log_level;

    Config()
    {
      set_defaults();
    }

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    // Environment variables override values from the file.
    void load_env();

    pipeline::Options pipeline_options() const;

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
  };

} // namespace faasbox::server::config

#endif
