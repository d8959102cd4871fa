#ifndef FAASBOX_PIPELINE_PIPELINE_HPP
#define FAASBOX_PIPELINE_PIPELINE_HPP

#include <faasbox/common/uuid.hpp>
#include <faasbox/pipeline/archive.hpp>
#include <faasbox/pipeline/function.hpp>
#include <faasbox/pipeline/handler.hpp>

#include <chrono>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace faasbox::pipeline {

  struct ImageBuilder;
  struct SandboxRunner;
  struct Registry;

  enum class Stage {
    RECEIVING_UPLOAD = 0,
    EXTRACTING,
    DETECTING_HANDLER,
    BUILDING,
    REGISTERING,
    DONE,
    FAILED
  };

  std::string stage_to_string(Stage stage);

  struct Options {
    std::string temp_dir_base;
    size_t max_file_size;
    std::chrono::milliseconds build_timeout;
    std::chrono::milliseconds run_timeout;
  };

  struct ExecutionResult {
    std::string output;
    long executed_at;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Sequences ingestion, detection, build and registration of functions,
  /// and runs deployed functions.
  ///
  /// Each submission owns a private working directory that is removed when the
  /// submission ends. Stages never retry. Errors surface as the exception of the
  /// stage that failed.
  ////////////////////////////////////////////////////////////////////////////////
  class Pipeline {
  public:
    static constexpr char DEFAULT_FUNCTION_NAME[] = "unnamed-function";

    Pipeline(Options options, ImageBuilder& builder, SandboxRunner& runner, Registry& registry);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Deploys the uploaded archive as a new function.
    ///
    /// @param[in] filename name of the uploaded file
    /// @param[in] upload archive contents
    /// @param[in] name display name; empty selects the default name
    /// @param[in] request_id identifier used in log messages
    /// @return metadata of the registered function
    ////////////////////////////////////////////////////////////////////////////////
    FunctionMetadata submit(
        const std::string& filename, std::istream& upload, const std::string& name,
        const std::string& request_id
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs a deployed function once.
    ///
    /// @throws common::InvalidRequest on an empty identifier,
    /// common::ObjectDoesNotExist on an unknown one
    ////////////////////////////////////////////////////////////////////////////////
    ExecutionResult execute(
        const std::string& function_id, const ExecutionInput& input,
        const std::string& request_id
    );

    std::vector<FunctionMetadata> list() const;

    // Throws common::ObjectDoesNotExist.
    FunctionMetadata get(const std::string& function_id) const;

    // Unregisters the function and requests removal of its image.
    void remove(const std::string& function_id, const std::string& request_id);

    const Options& options() const
    {
      return _options;
    }

  private:
    Options _options;

    ArchiveIngestor _ingestor;
    HandlerDetector _detector;

    ImageBuilder& _builder;
    SandboxRunner& _runner;
    Registry& _registry;

    common::UUID _uuid_generator;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::pipeline

#endif
