#ifndef FAASBOX_PIPELINE_WORKDIR_HPP
#define FAASBOX_PIPELINE_WORKDIR_HPP

#include <filesystem>
#include <string>

namespace faasbox::pipeline {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Ephemeral directory owned by a single submission.
  ///
  /// The directory is created in the constructor and removed recursively in the
  /// destructor, regardless of how the submission ended. A failed removal is
  /// logged and never propagated.
  ////////////////////////////////////////////////////////////////////////////////
  class WorkingDirectory {
  public:
    static constexpr char DIRECTORY_PREFIX[] = "faasbox-";
    static constexpr char EXTRACTED_SUBDIR[] = "extracted";

    // Empty base selects the system temporary directory.
    explicit WorkingDirectory(const std::string& base = "");
    ~WorkingDirectory();

    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;
    WorkingDirectory(WorkingDirectory&&) = delete;
    WorkingDirectory& operator=(WorkingDirectory&&) = delete;

    const std::filesystem::path& path() const
    {
      return _path;
    }

    std::filesystem::path extracted() const
    {
      return _path / EXTRACTED_SUBDIR;
    }

  private:
    std::filesystem::path _path;
  };

} // namespace faasbox::pipeline

#endif
