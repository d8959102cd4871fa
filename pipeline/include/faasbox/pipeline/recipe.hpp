#ifndef FAASBOX_PIPELINE_RECIPE_HPP
#define FAASBOX_PIPELINE_RECIPE_HPP

#include <faasbox/pipeline/function.hpp>

#include <filesystem>
#include <string>

namespace faasbox::pipeline::recipe {

  // File name of the rendered recipe inside the extracted root.
  static constexpr char RECIPE_NAME[] = "Dockerfile";

  static constexpr char TEMPLATE_EXTENSION[] = ".dockerfile";

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Reads the build template of a language from the template directory.
  ///
  /// @param[in] directory directory containing <language>.dockerfile files
  /// @param[in] language requested language
  /// @return template text
  /// @throws common::UnsupportedLanguage, common::TemplateLoadError
  ////////////////////////////////////////////////////////////////////////////////
  std::string load_template(const std::filesystem::path& directory, Language language);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Renders a build recipe. Pure function with no I/O.
  ///
  /// Templates of interpreted languages contain exactly one `{handler}`
  /// substitution point and escape literal braces by doubling them.
  /// Templates of compiled languages are returned verbatim.
  ///
  /// @param[in] language language of the function
  /// @param[in] tmpl template text
  /// @param[in] entry_point handler path relative to the code root
  /// @return rendered recipe
  /// @throws common::UnsupportedLanguage, common::InvalidRequest, common::TemplateLoadError
  ////////////////////////////////////////////////////////////////////////////////
  std::string render(Language language, const std::string& tmpl, const std::string& entry_point);

  // Entry points are embedded into shell commands of the recipe.
  bool valid_entry_point(const std::string& entry_point);

} // namespace faasbox::pipeline::recipe

#endif
