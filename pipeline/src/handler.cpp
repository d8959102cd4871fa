#include <faasbox/pipeline/handler.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/archive.hpp>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/istreamwrapper.h>
#include <fmt/format.h>

namespace faasbox::pipeline {

  HandlerDetector::HandlerDetector()
  {
    _logger = common::util::create_logger("HandlerDetector");
  }

  Language HandlerDetector::language_of(const std::filesystem::path& file)
  {
    auto ext = file.extension();
    if (ext == ".py") {
      return Language::PYTHON;
    }
    if (ext == ".go") {
      return Language::GOLANG;
    }
    return Language::NONE;
  }

  HandlerDescriptor HandlerDetector::detect(const std::filesystem::path& root) const
  {
    if (auto manifest = _read_manifest(root); manifest.has_value()) {
      _logger->info(
          "Handler detected from manifest: {}, language {}", manifest->entry_point,
          language_to_string(manifest->language)
      );
      return manifest.value();
    }

    if (auto handler = _scan_extensions(root); handler.has_value()) {
      _logger->info(
          "Handler detected: {}, language {}", handler->entry_point,
          language_to_string(handler->language)
      );
      return handler.value();
    }

    _logger->warn("No valid handler file found in {}", root.string());
    throw common::NoHandlerFound{"no valid handler file found (expected .py or .go)"};
  }

  std::optional<HandlerDescriptor>
  HandlerDetector::_read_manifest(const std::filesystem::path& root) const
  {
    std::filesystem::path manifest_path = root / MANIFEST_NAME;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(manifest_path, ec)) {
      return std::nullopt;
    }

    std::ifstream in_stream{manifest_path};
    if (!in_stream.is_open()) {
      _logger->warn("Could not open manifest {}", manifest_path.string());
      return std::nullopt;
    }

    rapidjson::Document doc;
    rapidjson::IStreamWrapper wrapper{in_stream};
    doc.ParseStream(wrapper);
    if (doc.HasParseError() || !doc.IsObject()) {
      _logger->warn("Ignoring malformed manifest {}", manifest_path.string());
      return std::nullopt;
    }

    auto handler_it = doc.FindMember("handler");
    auto language_it = doc.FindMember("language");
    if (handler_it == doc.MemberEnd() || !handler_it->value.IsString() ||
        language_it == doc.MemberEnd() || !language_it->value.IsString()) {
      _logger->warn("Manifest {} lacks handler or language", manifest_path.string());
      return std::nullopt;
    }

    std::string handler = handler_it->value.GetString();
    std::string language_str = language_it->value.GetString();
    if (handler.empty() || language_str.empty()) {
      return std::nullopt;
    }

    // The handler must stay inside the extracted tree.
    auto handler_path = ArchiveIngestor::resolve_entry(root, handler);
    if (!handler_path.has_value() || !std::filesystem::exists(handler_path.value(), ec)) {
      _logger->warn("Manifest handler {} does not exist", handler);
      return std::nullopt;
    }

    // A valid manifest is final; an unknown language is not replaced by a heuristic match.
    Language language = string_to_language(language_str);
    if (language == Language::NONE) {
      _logger->warn("Manifest names unsupported language {}", language_str);
      throw common::UnsupportedLanguage{language_str};
    }

    return HandlerDescriptor{handler, language};
  }

  std::optional<HandlerDescriptor>
  HandlerDetector::_scan_extensions(const std::filesystem::path& root) const
  {
    std::error_code ec;
    std::filesystem::directory_iterator it{root, ec};
    if (ec) {
      _logger->error("Failed to read directory {}, reason: {}", root.string(), ec.message());
      return std::nullopt;
    }

    std::vector<std::string> files;
    for (const auto& entry : it) {
      if (entry.is_directory(ec)) {
        continue;
      }
      files.push_back(entry.path().filename().string());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
      Language language = language_of(file);
      if (language != Language::NONE) {
        return HandlerDescriptor{file, language};
      }
    }
    return std::nullopt;
  }

} // namespace faasbox::pipeline
