#include <faasbox/common/exceptions.hpp>
#include <faasbox/pipeline/archive.hpp>
#include <faasbox/pipeline/workdir.hpp>

#include "helpers.hpp"

#include <sstream>

#include <gtest/gtest.h>

using namespace faasbox::pipeline;
namespace fs = std::filesystem;

class ArchiveTest : public ::testing::Test {
protected:
  fs::path create_archive(const std::vector<ZipEntry>& entries)
  {
    auto path = scratch.path() / "input.zip";
    write_zip(path, entries);
    return path;
  }

  std::filesystem::path save_and_extract(const fs::path& zip)
  {
    std::ifstream in{zip, std::ios::binary};
    auto saved = ingestor.save(workdir, "code.zip", in);
    return ingestor.extract(saved, workdir);
  }

  WorkingDirectory scratch;
  WorkingDirectory workdir;
  ArchiveIngestor ingestor{1024 * 1024};
};

TEST(WorkingDirectory, RemovedOnDestruction)
{
  fs::path path;
  {
    WorkingDirectory dir;
    path = dir.path();
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(path.filename().string().rfind(WorkingDirectory::DIRECTORY_PREFIX, 0), 0);

    write_file(dir.path() / "a" / "b" / "file.txt", "content");
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(WorkingDirectory, CustomBase)
{
  WorkingDirectory base;
  auto nested = base.path() / "nested";
  {
    WorkingDirectory dir{nested.string()};
    EXPECT_EQ(dir.path().parent_path(), nested);
    EXPECT_EQ(dir.extracted(), dir.path() / "extracted");
  }
  EXPECT_TRUE(fs::is_directory(nested));
  EXPECT_TRUE(fs::is_empty(nested));
}

TEST(ArchiveIngestor, SanitizeFilename)
{
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("code.zip"), "code.zip");
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("../../etc/passwd"), "passwd");
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("dir\\file.zip"), "file.zip");
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("my code (1).zip"), "my_code__1_.zip");
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("a..b.zip"), "a_b.zip");
  EXPECT_EQ(ArchiveIngestor::sanitize_filename(""), ArchiveIngestor::DEFAULT_ARCHIVE_NAME);
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("."), ArchiveIngestor::DEFAULT_ARCHIVE_NAME);
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("dir/"), ArchiveIngestor::DEFAULT_ARCHIVE_NAME);
  EXPECT_EQ(ArchiveIngestor::sanitize_filename("extracted"), "extracted.zip");
}

TEST(ArchiveIngestor, ResolveEntry)
{
  fs::path root{"/tmp/faasbox-test/extracted"};

  EXPECT_EQ(ArchiveIngestor::resolve_entry(root, "main.py"), root / "main.py");
  EXPECT_EQ(ArchiveIngestor::resolve_entry(root, "src/../main.py"), root / "main.py");
  EXPECT_EQ(ArchiveIngestor::resolve_entry(root, "./lib/util.py"), root / "lib/util.py");

  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, "").has_value());
  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, "../evil.py").has_value());
  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, "src/../../evil.py").has_value());
  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, "/etc/passwd").has_value());
  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, ".").has_value());
  // Sibling directory sharing the root as a name prefix.
  EXPECT_FALSE(ArchiveIngestor::resolve_entry(root, "../extracted-other/x").has_value());
}

TEST_F(ArchiveTest, SaveWithinLimit)
{
  std::string content(1000, 'x');
  std::stringstream in{content};

  auto path = ingestor.save(workdir, "../upload.zip", in);

  EXPECT_EQ(path, workdir.path() / "upload.zip");
  EXPECT_EQ(fs::file_size(path), content.size());
}

TEST_F(ArchiveTest, SaveTooLarge)
{
  ArchiveIngestor small{100};

  {
    std::string content(150, 'x');
    std::stringstream in{content};
    EXPECT_THROW(small.save(workdir, "code.zip", in), faasbox::common::UploadTooLarge);
    EXPECT_FALSE(fs::exists(workdir.path() / "code.zip"));
  }

  // Reaching the ceiling exactly is rejected too.
  {
    std::string content(100, 'x');
    std::stringstream in{content};
    EXPECT_THROW(small.save(workdir, "code.zip", in), faasbox::common::UploadTooLarge);
    EXPECT_FALSE(fs::exists(workdir.path() / "code.zip"));
  }

  {
    std::string content(99, 'x');
    std::stringstream in{content};
    EXPECT_NO_THROW(small.save(workdir, "code.zip", in));
  }
}

TEST_F(ArchiveTest, ExtractFilesAndDirectories)
{
  auto zip = create_archive(
      {{"main.py", "print('hello')"},
       {"lib/", "", AE_IFDIR},
       {"lib/util.py", "X = 1"},
       {"deep/nested/data.txt", "data"},
       {"run.sh", "#!/bin/sh", AE_IFREG, 0755}}
  );

  auto root = save_and_extract(zip);

  EXPECT_EQ(root, fs::weakly_canonical(workdir.extracted()));
  EXPECT_EQ(read_file(root / "main.py"), "print('hello')");
  EXPECT_TRUE(fs::is_directory(root / "lib"));
  EXPECT_EQ(read_file(root / "lib" / "util.py"), "X = 1");
  EXPECT_EQ(read_file(root / "deep" / "nested" / "data.txt"), "data");

  auto perms = fs::status(root / "run.sh").permissions();
  EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
}

TEST_F(ArchiveTest, PathTraversalEntriesSkipped)
{
  auto zip = create_archive(
      {{"../evil.txt", "evil"},
       {"ok/../../evil2.txt", "evil"},
       {"/tmp/faasbox-absolute-evil.txt", "evil"},
       {"main.py", "print('hello')"}}
  );

  auto root = save_and_extract(zip);

  EXPECT_TRUE(fs::exists(root / "main.py"));
  EXPECT_FALSE(fs::exists(workdir.path() / "evil.txt"));
  EXPECT_FALSE(fs::exists(workdir.path() / "evil2.txt"));
  EXPECT_FALSE(fs::exists("/tmp/faasbox-absolute-evil.txt"));

  // Nothing outside of the root apart from the uploaded archive.
  size_t count = 0;
  for (const auto& entry : fs::directory_iterator{workdir.path()}) {
    EXPECT_TRUE(entry.path().filename() == "code.zip" || entry.path().filename() == "extracted");
    ++count;
  }
  EXPECT_EQ(count, 2);
}

TEST_F(ArchiveTest, SymlinksSkipped)
{
  auto zip = create_archive(
      {{"link", "", AE_IFLNK, 0777, "/etc/passwd"}, {"main.py", "print('hello')"}}
  );

  auto root = save_and_extract(zip);

  EXPECT_FALSE(fs::exists(fs::symlink_status(root / "link")));
  EXPECT_TRUE(fs::exists(root / "main.py"));
}

TEST_F(ArchiveTest, CorruptedArchive)
{
  auto path = scratch.path() / "broken.zip";
  write_file(path, std::string(600, '\xff'));

  std::ifstream in{path, std::ios::binary};
  auto saved = ingestor.save(workdir, "broken.zip", in);
  EXPECT_THROW(ingestor.extract(saved, workdir), faasbox::common::ResourceError);
}

TEST_F(ArchiveTest, MissingArchive)
{
  EXPECT_THROW(
      ingestor.extract(workdir.path() / "missing.zip", workdir), faasbox::common::ArchiveOpenError
  );
}
