#include <faasbox/pipeline/function.hpp>

namespace faasbox::pipeline {

  std::string language_to_string(Language val)
  {
    switch (val) {
    case Language::PYTHON:
      return "python";
    case Language::GOLANG:
      return "golang";
    case Language::NONE:
      return "";
    }
    return "";
  }

  Language string_to_language(const std::string& language)
  {
    if (language == "python") {
      return Language::PYTHON;
    }
    if (language == "golang") {
      return Language::GOLANG;
    }
    return Language::NONE;
  }

  bool is_interpreted(Language val)
  {
    return val == Language::PYTHON;
  }

} // namespace faasbox::pipeline
