#ifndef FAASBOX_PIPELINE_TESTS_HELPERS_HPP
#define FAASBOX_PIPELINE_TESTS_HELPERS_HPP

#include <faasbox/pipeline/builder.hpp>
#include <faasbox/pipeline/sandbox.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

struct ZipEntry {
  std::string name;
  std::string content{};
  mode_t type = AE_IFREG;
  mode_t perms = 0644;
  std::string link_target{};
};

inline void write_zip(const std::filesystem::path& path, const std::vector<ZipEntry>& entries)
{
  struct archive* writer = archive_write_new();
  ASSERT_NE(writer, nullptr);
  ASSERT_EQ(archive_write_set_format_zip(writer), ARCHIVE_OK);
  ASSERT_EQ(archive_write_open_filename(writer, path.c_str()), ARCHIVE_OK);

  for (const auto& e : entries) {
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, e.name.c_str());
    archive_entry_set_filetype(entry, e.type);
    archive_entry_set_perm(entry, e.type == AE_IFDIR ? 0755 : e.perms);
    if (e.type == AE_IFLNK) {
      archive_entry_set_symlink(entry, e.link_target.c_str());
    }
    archive_entry_set_size(entry, e.type == AE_IFREG ? static_cast<la_int64_t>(e.content.size()) : 0);

    EXPECT_EQ(archive_write_header(writer, entry), ARCHIVE_OK);
    if (e.type == AE_IFREG && !e.content.empty()) {
      archive_write_data(writer, e.content.data(), e.content.size());
    }
    archive_entry_free(entry);
  }

  archive_write_close(writer);
  archive_write_free(writer);
}

inline std::string read_file(const std::filesystem::path& path)
{
  std::ifstream in{path};
  return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

inline void write_file(const std::filesystem::path& path, const std::string& content)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out{path, std::ios::trunc};
  out << content;
}

// Shell script standing in for the docker client.
inline std::filesystem::path
write_fake_docker(const std::filesystem::path& dir, const std::string& body)
{
  auto path = dir / "fake-docker";
  write_file(path, "#!/bin/sh\n" + body + "\n");
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

class MockImageBuilder : public faasbox::pipeline::ImageBuilder {
public:
  MOCK_METHOD(
      std::string, build,
      (const std::filesystem::path&, const faasbox::pipeline::HandlerDescriptor&,
       std::chrono::milliseconds),
      (override)
  );
  MOCK_METHOD(void, remove, (const std::string&), (override));
  MOCK_METHOD(void, prune, (), (override));
};

class MockSandboxRunner : public faasbox::pipeline::SandboxRunner {
public:
  MOCK_METHOD(
      std::string, run,
      (const std::string&, const faasbox::pipeline::ExecutionInput&, std::chrono::milliseconds),
      (override)
  );
  MOCK_METHOD(void, shutdown, (), (override));
};

#endif
