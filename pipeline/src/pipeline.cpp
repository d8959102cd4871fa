#include <faasbox/pipeline/pipeline.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/builder.hpp>
#include <faasbox/pipeline/registry.hpp>
#include <faasbox/pipeline/sandbox.hpp>
#include <faasbox/pipeline/workdir.hpp>

#include <optional>

#include <fmt/format.h>

namespace faasbox::pipeline {

  std::string stage_to_string(Stage stage)
  {
    switch (stage) {
    case Stage::RECEIVING_UPLOAD:
      return "ReceivingUpload";
    case Stage::EXTRACTING:
      return "Extracting";
    case Stage::DETECTING_HANDLER:
      return "DetectingHandler";
    case Stage::BUILDING:
      return "Building";
    case Stage::REGISTERING:
      return "Registering";
    case Stage::DONE:
      return "Done";
    case Stage::FAILED:
      return "Failed";
    default:
      return "";
    }
  }

  Pipeline::Pipeline(
      Options options, ImageBuilder& builder, SandboxRunner& runner, Registry& registry
  )
      : _options(std::move(options)), _ingestor(_options.max_file_size), _builder(builder),
        _runner(runner), _registry(registry)
  {
    _logger = common::util::create_logger("Pipeline");
  }

  FunctionMetadata Pipeline::submit(
      const std::string& filename, std::istream& upload, const std::string& name,
      const std::string& request_id
  )
  {
    Stage stage = Stage::RECEIVING_UPLOAD;
    auto transition = [&](Stage next) {
      stage = next;
      _logger->info("[{}] Submission stage {}", request_id, stage_to_string(stage));
    };

    try {

      transition(Stage::RECEIVING_UPLOAD);
      // Removed on every exit path of this scope.
      WorkingDirectory workdir{_options.temp_dir_base};
      auto archive_path = _ingestor.save(workdir, filename, upload);

      transition(Stage::EXTRACTING);
      auto root = _ingestor.extract(archive_path, workdir);

      transition(Stage::DETECTING_HANDLER);
      HandlerDescriptor handler = _detector.detect(root);

      transition(Stage::BUILDING);
      std::string image_id = _builder.build(root, handler, _options.build_timeout);

      transition(Stage::REGISTERING);
      FunctionMetadata metadata{
          _uuid_generator.generate_str(),
          image_id,
          handler.language,
          common::util::unix_timestamp(),
          std::nullopt,
          name.empty() ? DEFAULT_FUNCTION_NAME : name};
      _registry.store(metadata);

      transition(Stage::DONE);
      _logger->info(
          "[{}] Deployed function {} ({}) as {}", request_id, metadata.function_id, metadata.name,
          metadata.image_id
      );
      return metadata;

    } catch (common::FaasboxException& exc) {
      _logger->error(
          "[{}] Submission {} in stage {}: {}", request_id, stage_to_string(Stage::FAILED),
          stage_to_string(stage), exc.what()
      );
      throw;
    } catch (std::exception& exc) {
      _logger->error(
          "[{}] Submission {} in stage {}: {}", request_id, stage_to_string(Stage::FAILED),
          stage_to_string(stage), exc.what()
      );
      throw common::ResourceError{
          fmt::format("stage {} failed: {}", stage_to_string(stage), exc.what())};
    }
  }

  ExecutionResult Pipeline::execute(
      const std::string& function_id, const ExecutionInput& input, const std::string& request_id
  )
  {
    if (function_id.empty()) {
      throw common::InvalidRequest{"the 'functionId' parameter is required"};
    }
    if (input.contains("")) {
      throw common::InvalidRequest{"input names must not be empty"};
    }

    std::optional<FunctionMetadata> metadata = _registry.get(function_id);
    if (!metadata.has_value()) {
      _logger->warn("[{}] Function {} not found", request_id, function_id);
      throw common::ObjectDoesNotExist{fmt::format("function {} not found", function_id)};
    }

    _logger->info(
        "[{}] Executing function {} with image {}", request_id, function_id, metadata->image_id
    );
    std::string output = _runner.run(metadata->image_id, input, _options.run_timeout);

    long executed_at = common::util::unix_timestamp();
    try {
      if (!_registry.mark_executed(function_id, executed_at)) {
        _logger->warn(
            "[{}] Function {} disappeared before recording its execution", request_id, function_id
        );
      }
    } catch (std::exception& exc) {
      _logger->warn(
          "[{}] Failed to record execution of {}: {}", request_id, function_id, exc.what()
      );
    }

    return ExecutionResult{std::move(output), executed_at};
  }

  std::vector<FunctionMetadata> Pipeline::list() const
  {
    return _registry.list();
  }

  FunctionMetadata Pipeline::get(const std::string& function_id) const
  {
    std::optional<FunctionMetadata> metadata = _registry.get(function_id);
    if (!metadata.has_value()) {
      throw common::ObjectDoesNotExist{fmt::format("function {} not found", function_id)};
    }
    return metadata.value();
  }

  void Pipeline::remove(const std::string& function_id, const std::string& request_id)
  {
    std::optional<FunctionMetadata> metadata = _registry.get(function_id);
    if (!metadata.has_value() || !_registry.remove(function_id)) {
      throw common::ObjectDoesNotExist{fmt::format("function {} not found", function_id)};
    }

    _logger->info("[{}] Deleted function {}", request_id, function_id);
    _builder.remove(metadata->image_id);
  }

} // namespace faasbox::pipeline
