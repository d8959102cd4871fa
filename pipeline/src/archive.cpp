#include <faasbox/pipeline/archive.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/workdir.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <system_error>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

namespace faasbox::pipeline {

  namespace {

    struct ArchiveReaderDeleter {
      void operator()(archive* ptr) const
      {
        archive_read_free(ptr);
      }
    };

    using archive_reader_t = std::unique_ptr<archive, ArchiveReaderDeleter>;

    std::string archive_error(archive* ptr)
    {
      const char* msg = archive_error_string(ptr);
      return msg ? msg : "unknown libarchive error";
    }

    std::filesystem::perms entry_permissions(mode_t mode, std::filesystem::perms required)
    {
      auto perms = static_cast<std::filesystem::perms>(mode & 0777);
      return perms | required;
    }

  } // namespace

  ArchiveIngestor::ArchiveIngestor(size_t max_size) : _max_size(max_size)
  {
    _logger = common::util::create_logger("ArchiveIngestor");
  }

  std::string ArchiveIngestor::sanitize_filename(const std::string& filename)
  {
    auto pos = filename.find_last_of("/\\");
    std::string base = pos == std::string::npos ? filename : filename.substr(pos + 1);

    std::string result;
    result.reserve(base.size());
    for (size_t i = 0; i < base.size(); ++i) {

      char c = base[i];
      // Neutralize any ".." sequence, even without a separator.
      if (c == '.' && i + 1 < base.size() && base[i + 1] == '.') {
        result.push_back('_');
        ++i;
      } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
        result.push_back(c);
      } else {
        result.push_back('_');
      }
    }

    if (result.empty() || result.find_first_not_of('.') == std::string::npos) {
      return DEFAULT_ARCHIVE_NAME;
    }
    // The extraction subdirectory shares the working directory with the archive.
    if (result == WorkingDirectory::EXTRACTED_SUBDIR) {
      result += ".zip";
    }
    return result;
  }

  std::optional<std::filesystem::path>
  ArchiveIngestor::resolve_entry(const std::filesystem::path& root, std::string_view name)
  {
    if (name.empty()) {
      return std::nullopt;
    }

    std::filesystem::path entry{name};
    if (entry.is_absolute()) {
      return std::nullopt;
    }

    std::string prefix = root.lexically_normal().string();
    if (prefix.empty() || prefix.back() != std::filesystem::path::preferred_separator) {
      prefix.push_back(std::filesystem::path::preferred_separator);
    }

    std::filesystem::path destination = (root / entry).lexically_normal();
    const std::string& dest_str = destination.native();
    if (dest_str.size() <= prefix.size() || dest_str.compare(0, prefix.size(), prefix) != 0) {
      return std::nullopt;
    }

    return destination;
  }

  std::filesystem::path ArchiveIngestor::save(
      const WorkingDirectory& dir, const std::string& filename, std::istream& in
  ) const
  {
    std::filesystem::path archive_path = dir.path() / sanitize_filename(filename);

    size_t written = 0;
    {
      std::ofstream out{archive_path, std::ios::binary | std::ios::trunc};
      if (!out.is_open()) {
        throw common::IOError{fmt::format("Could not create file {}", archive_path.string())};
      }

      std::vector<char> buffer(COPY_BUFFER_SIZE);
      while (written < _max_size && in) {

        size_t to_read = std::min(buffer.size(), _max_size - written);
        in.read(buffer.data(), static_cast<std::streamsize>(to_read));
        std::streamsize count = in.gcount();
        if (count <= 0) {
          break;
        }

        out.write(buffer.data(), count);
        if (!out) {
          out.close();
          std::error_code ec;
          std::filesystem::remove(archive_path, ec);
          throw common::IOError{fmt::format("Failed to write file {}", archive_path.string())};
        }
        written += static_cast<size_t>(count);
      }

      if (in.bad()) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(archive_path, ec);
        throw common::IOError{"Failed to read the uploaded archive"};
      }
    }

    if (written >= _max_size) {

      _logger->warn(
          "File size limit reached for {}, size {}, limit {}", archive_path.string(), written,
          _max_size
      );
      std::error_code ec;
      std::filesystem::remove(archive_path, ec);
      if (ec) {
        _logger->error("Could not remove partial upload {}: {}", archive_path.string(), ec.message());
      }
      throw common::UploadTooLarge{
          fmt::format("file too large: maximum size is {} bytes", _max_size)};
    }

    _logger->debug("Saved archive {}, size {}", archive_path.string(), written);
    return archive_path;
  }

  std::filesystem::path ArchiveIngestor::extract(
      const std::filesystem::path& archive_path, const WorkingDirectory& dir
  ) const
  {
    archive_reader_t reader{archive_read_new()};
    if (!reader) {
      throw common::ArchiveOpenError{"Could not allocate the archive reader"};
    }
    archive_read_support_format_all(reader.get());
    archive_read_support_filter_all(reader.get());

    constexpr size_t BLOCK_SIZE = 10240;
    if (archive_read_open_filename(reader.get(), archive_path.c_str(), BLOCK_SIZE) != ARCHIVE_OK) {
      throw common::ArchiveOpenError{fmt::format(
          "Failed to open archive {}, reason: {}", archive_path.filename().string(),
          archive_error(reader.get())
      )};
    }

    std::filesystem::path extract_dir = dir.extracted();
    std::error_code ec;
    if (!std::filesystem::create_directory(extract_dir, ec) || ec) {
      throw common::DirectoryCreationError{fmt::format(
          "Failed to create extraction directory {}, reason: {}", extract_dir.string(),
          ec ? ec.message() : "already exists"
      )};
    }
    std::filesystem::path root = std::filesystem::weakly_canonical(extract_dir);

    archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    std::array<char, COPY_BUFFER_SIZE> buffer{};
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK ||
           status == ARCHIVE_WARN) {

      if (status == ARCHIVE_WARN) {
        _logger->warn("Warning while reading archive entry: {}", archive_error(reader.get()));
      }

      const char* name = archive_entry_pathname(entry);
      auto destination = resolve_entry(root, name ? name : "");
      if (!destination.has_value()) {
        _logger->warn("Skipping invalid archive entry path: {}", name ? name : "<empty>");
        continue;
      }

      mode_t type = archive_entry_filetype(entry);
      if (type == AE_IFDIR) {

        std::filesystem::create_directories(destination.value(), ec);
        if (ec) {
          throw common::DirectoryCreationError{fmt::format(
              "Failed to create directory {}, reason: {}", destination->string(), ec.message()
          )};
        }
        std::filesystem::permissions(
            destination.value(),
            entry_permissions(archive_entry_perm(entry), std::filesystem::perms::owner_all), ec
        );
        continue;
      }

      if (type != AE_IFREG) {
        _logger->warn("Skipping archive entry {} of unsupported type", name);
        continue;
      }

      std::filesystem::create_directories(destination->parent_path(), ec);
      if (ec) {
        throw common::DirectoryCreationError{fmt::format(
            "Failed to create parent directories {}, reason: {}",
            destination->parent_path().string(), ec.message()
        )};
      }

      {
        std::ofstream out{destination.value(), std::ios::binary | std::ios::trunc};
        if (!out.is_open()) {
          throw common::IOError{fmt::format("Failed to create file {}", destination->string())};
        }

        la_ssize_t size = 0;
        while ((size = archive_read_data(reader.get(), buffer.data(), buffer.size())) > 0) {
          out.write(buffer.data(), size);
          if (!out) {
            throw common::IOError{fmt::format("Failed to extract file {}", destination->string())};
          }
        }
        if (size < 0) {
          throw common::IOError{fmt::format(
              "Failed to read archive entry {}, reason: {}", name, archive_error(reader.get())
          )};
        }
      }

      std::filesystem::permissions(
          destination.value(),
          entry_permissions(
              archive_entry_perm(entry),
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
          ),
          ec
      );
      if (ec) {
        _logger->warn("Could not set permissions of {}: {}", destination->string(), ec.message());
      }
    }

    if (status != ARCHIVE_EOF) {
      throw common::IOError{
          fmt::format("Failed to read archive, reason: {}", archive_error(reader.get()))};
    }

    _logger->debug("Extracted archive {} into {}", archive_path.string(), root.string());
    return root;
  }

} // namespace faasbox::pipeline
