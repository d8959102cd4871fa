#ifndef FAASBOX_PIPELINE_ARCHIVE_HPP
#define FAASBOX_PIPELINE_ARCHIVE_HPP

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace faasbox::pipeline {

  class WorkingDirectory;

  class ArchiveIngestor {
  public:
    static constexpr char DEFAULT_ARCHIVE_NAME[] = "upload.zip";
    static constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

    explicit ArchiveIngestor(size_t max_size);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Stores the uploaded archive in the working directory.
    ///
    /// The stream is copied until EOF or until the byte ceiling is reached. An
    /// upload that reaches the ceiling is rejected and the partial file removed.
    ///
    /// @param[in] dir working directory of the submission
    /// @param[in] filename name supplied by the caller; only a sanitized base name is used
    /// @param[in] in upload body
    /// @return path of the stored archive
    /// @throws common::UploadTooLarge, common::IOError
    ////////////////////////////////////////////////////////////////////////////////
    std::filesystem::path
    save(const WorkingDirectory& dir, const std::string& filename, std::istream& in) const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Extracts the archive into the `extracted` subdirectory.
    ///
    /// Entries resolving outside of the extraction root are skipped and logged.
    ///
    /// @param[in] archive_path archive stored by save
    /// @param[in] dir working directory of the submission
    /// @return extraction root
    /// @throws common::ArchiveOpenError, common::DirectoryCreationError, common::IOError
    ////////////////////////////////////////////////////////////////////////////////
    std::filesystem::path
    extract(const std::filesystem::path& archive_path, const WorkingDirectory& dir) const;

    size_t max_size() const
    {
      return _max_size;
    }

    static std::string sanitize_filename(const std::string& filename);

    // Destination of an entry, or nothing if it would escape the root.
    static std::optional<std::filesystem::path>
    resolve_entry(const std::filesystem::path& root, std::string_view name);

  private:
    size_t _max_size;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::pipeline

#endif
