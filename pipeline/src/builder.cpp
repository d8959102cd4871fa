#include <faasbox/pipeline/builder.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/recipe.hpp>
#include <faasbox/pipeline/subprocess.hpp>

#include <fstream>
#include <sstream>

#include <fmt/format.h>

namespace faasbox::pipeline {

  // Removal and pruning are housekeeping; they get a fixed deadline.
  static constexpr std::chrono::seconds HOUSEKEEPING_TIMEOUT{60};

  DockerImageBuilder::DockerImageBuilder(
      std::string docker_binary, std::string image_prefix, std::filesystem::path templates
  )
      : _docker_binary(std::move(docker_binary)), _image_prefix(std::move(image_prefix)),
        _templates(std::move(templates))
  {
    _logger = common::util::create_logger("ImageBuilder");
  }

  std::string DockerImageBuilder::build(
      const std::filesystem::path& root, const HandlerDescriptor& handler,
      std::chrono::milliseconds timeout
  )
  {
    // Unsupported languages never reach the toolchain.
    std::string tmpl = recipe::load_template(_templates, handler.language);
    std::string rendered = recipe::render(handler.language, tmpl, handler.entry_point);
    _write_recipe(root, rendered);

    std::string tag = image_tag(handler.language, common::util::unix_timestamp());
    _logger->info("Building image {} from {}", tag, root.string());

    ProcessResult result =
        Subprocess::run({_docker_binary, "build", "-t", tag, root.string()}, timeout);

    if (result.timed_out) {
      _logger->error("Build of {} exceeded {}", tag, common::util::format_duration(timeout));
      throw common::TimeoutError{fmt::format(
          "image build timed out after {}", common::util::format_duration(timeout)
      )};
    }

    if (result.exit_code != 0) {
      _logger->error("Build of {} failed with status {}", tag, result.exit_code);
      throw common::BuildFailed{
          fmt::format("docker build failed with exit code {}", result.exit_code),
          trim_output(result.output)};
    }

    auto image_id = extract_image_id(result.output);
    if (!image_id.has_value()) {
      _logger->warn("Could not find image digest in build output, using tag {}", tag);
      return tag;
    }

    _logger->info("Built image {} as {}", image_id.value(), tag);
    return image_id.value();
  }

  void DockerImageBuilder::remove(const std::string& image)
  {
    try {
      ProcessResult result =
          Subprocess::run({_docker_binary, "rmi", "-f", image}, HOUSEKEEPING_TIMEOUT);
      if (!result.success()) {
        _logger->warn(
            "Removing image {} failed with status {}: {}", image, result.exit_code, result.output
        );
      } else {
        _logger->info("Removed image {}", image);
      }
    } catch (common::FaasboxException& exc) {
      _logger->warn("Removing image {} failed: {}", image, exc.what());
    }
  }

  void DockerImageBuilder::prune()
  {
    try {
      ProcessResult result =
          Subprocess::run({_docker_binary, "image", "prune", "-f"}, HOUSEKEEPING_TIMEOUT);
      if (!result.success()) {
        _logger->warn("Pruning images failed with status {}: {}", result.exit_code, result.output);
      } else {
        _logger->info("Pruned dangling images");
      }
    } catch (common::FaasboxException& exc) {
      _logger->warn("Pruning images failed: {}", exc.what());
    }
  }

  std::string DockerImageBuilder::image_tag(Language language, long timestamp) const
  {
    return fmt::format("{}:{}-{}", _image_prefix, language_to_string(language), timestamp);
  }

  std::optional<std::string> DockerImageBuilder::extract_image_id(const std::string& output)
  {
    std::istringstream lines{output};
    std::string line;
    while (std::getline(lines, line)) {

      if (line.find(DIGEST_MARKER) == std::string::npos) {
        continue;
      }

      std::istringstream tokens{line};
      std::string token;
      while (tokens >> token) {
        if (token.starts_with(DIGEST_PREFIX)) {
          return token;
        }
      }
    }
    return std::nullopt;
  }

  std::string DockerImageBuilder::trim_output(const std::string& output)
  {
    if (output.size() <= MAX_ERROR_OUTPUT) {
      return output;
    }
    return output.substr(output.size() - MAX_ERROR_OUTPUT);
  }

  void DockerImageBuilder::_write_recipe(
      const std::filesystem::path& root, const std::string& recipe
  ) const
  {
    std::filesystem::path recipe_path = root / recipe::RECIPE_NAME;
    std::ofstream out{recipe_path, std::ios::out | std::ios::trunc};
    if (!out.is_open()) {
      throw common::WriteError{fmt::format("failed to create {}", recipe_path.string())};
    }

    out << recipe;
    out.close();
    if (out.fail()) {
      throw common::WriteError{fmt::format("failed to write {}", recipe_path.string())};
    }
    SPDLOG_DEBUG("Wrote build recipe {}", recipe_path.string());
  }

} // namespace faasbox::pipeline
