#ifndef FAASBOX_PIPELINE_BUILDER_HPP
#define FAASBOX_PIPELINE_BUILDER_HPP

#include <faasbox/pipeline/function.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace faasbox::pipeline {

  struct ImageBuilder {

    ImageBuilder() = default;
    ImageBuilder(const ImageBuilder&) = default;
    ImageBuilder(ImageBuilder&&) = delete;
    ImageBuilder& operator=(const ImageBuilder&) = default;
    ImageBuilder& operator=(ImageBuilder&&) = delete;
    virtual ~ImageBuilder() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Builds a container image from the extracted code tree.
    ///
    /// @param[in] root extracted code root; the recipe is written there
    /// @param[in] handler detected entry point and language
    /// @param[in] timeout deadline of the external build
    /// @return image handle: content digest or the fallback tag
    /// @throws common::UnsupportedLanguage, common::TemplateLoadError, common::WriteError,
    /// common::BuildFailed, common::TimeoutError
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::string build(
        const std::filesystem::path& root, const HandlerDescriptor& handler,
        std::chrono::milliseconds timeout
    ) = 0;

    // Best-effort removal of an image; failures are logged.
    virtual void remove(const std::string& image) = 0;

    // Best-effort removal of dangling images.
    virtual void prune() = 0;
  };

  class DockerImageBuilder : public ImageBuilder {
  public:
    static constexpr size_t MAX_ERROR_OUTPUT = 4096;
    static constexpr char DIGEST_MARKER[] = "writing image sha256:";
    static constexpr char DIGEST_PREFIX[] = "sha256:";

    DockerImageBuilder(
        std::string docker_binary, std::string image_prefix, std::filesystem::path templates
    );

    std::string build(
        const std::filesystem::path& root, const HandlerDescriptor& handler,
        std::chrono::milliseconds timeout
    ) override;

    void remove(const std::string& image) override;

    void prune() override;

    std::string image_tag(Language language, long timestamp) const;

    static std::optional<std::string> extract_image_id(const std::string& output);

    // Keeps the last MAX_ERROR_OUTPUT bytes.
    static std::string trim_output(const std::string& output);

  private:
    void _write_recipe(const std::filesystem::path& root, const std::string& recipe) const;

    std::string _docker_binary;
    std::string _image_prefix;
    std::filesystem::path _templates;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::pipeline

#endif
