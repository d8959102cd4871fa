#ifndef FAASBOX_PIPELINE_FUNCTION_HPP
#define FAASBOX_PIPELINE_FUNCTION_HPP

#include <map>
#include <optional>
#include <string>

namespace faasbox::pipeline {

  enum class Language { PYTHON = 0, GOLANG, NONE };

  std::string language_to_string(Language val);

  Language string_to_language(const std::string& language);

  // Interpreted languages receive the entry point in their build recipe.
  bool is_interpreted(Language val);

  struct HandlerDescriptor {
    // Path of the entry point, relative to the extracted root.
    std::string entry_point;
    Language language;
  };

  struct FunctionMetadata {
    std::string function_id;
    std::string image_id;
    Language language;
    long created_at;
    std::optional<long> last_executed;
    std::string name;
  };

  using ExecutionInput = std::map<std::string, std::string>;

} // namespace faasbox::pipeline

#endif
