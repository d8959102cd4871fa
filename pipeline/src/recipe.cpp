#include <faasbox/pipeline/recipe.hpp>

#include <faasbox/common/exceptions.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace faasbox::pipeline::recipe {

  std::string load_template(const std::filesystem::path& directory, Language language)
  {
    if (language == Language::NONE) {
      throw common::UnsupportedLanguage{language_to_string(language)};
    }

    std::filesystem::path template_file =
        directory / (language_to_string(language) + TEMPLATE_EXTENSION);
    SPDLOG_DEBUG("Loading template file {}", template_file.string());

    std::ifstream in_stream{template_file};
    if (!in_stream.is_open()) {
      throw common::TemplateLoadError{
          fmt::format("failed to read template file {}", template_file.string())};
    }

    std::stringstream buffer;
    buffer << in_stream.rdbuf();
    if (in_stream.bad()) {
      throw common::TemplateLoadError{
          fmt::format("failed to read template file {}", template_file.string())};
    }
    return buffer.str();
  }

  bool valid_entry_point(const std::string& entry_point)
  {
    if (entry_point.empty()) {
      return false;
    }
    for (char c : entry_point) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.' &&
          c != '/') {
        return false;
      }
    }
    return true;
  }

  std::string render(Language language, const std::string& tmpl, const std::string& entry_point)
  {
    if (language == Language::NONE) {
      throw common::UnsupportedLanguage{language_to_string(language)};
    }

    if (!is_interpreted(language)) {
      return tmpl;
    }

    if (!valid_entry_point(entry_point)) {
      throw common::InvalidRequest{fmt::format("invalid handler path: {}", entry_point)};
    }

    try {
      return fmt::format(fmt::runtime(tmpl), fmt::arg("handler", entry_point));
    } catch (fmt::format_error& err) {
      throw common::TemplateLoadError{
          fmt::format("malformed template for {}: {}", language_to_string(language), err.what())};
    }
  }

} // namespace faasbox::pipeline::recipe
