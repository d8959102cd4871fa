#include <faasbox/pipeline/workdir.hpp>

#include <faasbox/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdlib.h>

namespace faasbox::pipeline {

  WorkingDirectory::WorkingDirectory(const std::string& base)
  {
    std::filesystem::path parent = base.empty() ? std::filesystem::temp_directory_path()
                                                : std::filesystem::path{base};

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw common::DirectoryCreationError{
          fmt::format("Could not create temporary base {}, reason: {}", parent.string(), ec.message())};
    }

    std::string tmpl = (parent / fmt::format("{}XXXXXX", DIRECTORY_PREFIX)).string();
    if (mkdtemp(tmpl.data()) == nullptr) {
      throw common::DirectoryCreationError{fmt::format(
          "Could not create working directory in {}, reason: {}", parent.string(), strerror(errno)
      )};
    }
    _path = tmpl;
    SPDLOG_DEBUG("Created working directory {}", _path.string());
  }

  WorkingDirectory::~WorkingDirectory()
  {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    if (ec) {
      spdlog::error("Failed to clean up working directory {}, reason: {}", _path.string(), ec.message());
    } else {
      SPDLOG_DEBUG("Removed working directory {}", _path.string());
    }
  }

} // namespace faasbox::pipeline
