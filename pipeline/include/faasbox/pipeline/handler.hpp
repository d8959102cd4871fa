#ifndef FAASBOX_PIPELINE_HANDLER_HPP
#define FAASBOX_PIPELINE_HANDLER_HPP

#include <faasbox/pipeline/function.hpp>

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace faasbox::pipeline {

  class HandlerDetector {
  public:
    static constexpr char MANIFEST_NAME[] = "serverless.json";

    HandlerDetector();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Determines the entry point and language of the extracted code.
    ///
    /// A valid manifest at the root always wins. Otherwise, root-level regular files
    /// are scanned in lexicographic order and the first known extension is chosen.
    ///
    /// @param[in] root extraction root
    /// @return handler relative to the root and its language
    /// @throws common::NoHandlerFound, or common::UnsupportedLanguage when the
    /// manifest names an unknown language
    ////////////////////////////////////////////////////////////////////////////////
    HandlerDescriptor detect(const std::filesystem::path& root) const;

    // Maps ".py" and ".go"; everything else is Language::NONE.
    static Language language_of(const std::filesystem::path& file);

  private:
    std::optional<HandlerDescriptor> _read_manifest(const std::filesystem::path& root) const;

    std::optional<HandlerDescriptor> _scan_extensions(const std::filesystem::path& root) const;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::pipeline

#endif
