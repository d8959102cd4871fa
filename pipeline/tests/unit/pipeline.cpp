#include <faasbox/common/exceptions.hpp>
#include <faasbox/pipeline/pipeline.hpp>
#include <faasbox/pipeline/registry.hpp>
#include <faasbox/pipeline/workdir.hpp>

#include "helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace faasbox::pipeline;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    base = scratch.path() / "work";
    std::filesystem::create_directories(base);
    pipeline = std::make_unique<Pipeline>(
        Options{base.string(), 1024 * 1024, 5s, 3s}, builder, runner, registry
    );
  }

  std::filesystem::path archive(const std::vector<ZipEntry>& entries)
  {
    auto path = scratch.path() / "upload.zip";
    write_zip(path, entries);
    return path;
  }

  FunctionMetadata submit(const std::filesystem::path& zip, const std::string& name = "")
  {
    std::ifstream in{zip, std::ios::binary};
    return pipeline->submit("code.zip", in, name, "req-1");
  }

  // Every working directory has been removed.
  bool clean() const
  {
    return std::filesystem::is_empty(base);
  }

  WorkingDirectory scratch;
  std::filesystem::path base;

  MockImageBuilder builder;
  MockSandboxRunner runner;
  FunctionTable registry;
  std::unique_ptr<Pipeline> pipeline;
};

TEST(Pipeline, StageNames)
{
  EXPECT_EQ(stage_to_string(Stage::RECEIVING_UPLOAD), "ReceivingUpload");
  EXPECT_EQ(stage_to_string(Stage::DETECTING_HANDLER), "DetectingHandler");
  EXPECT_EQ(stage_to_string(Stage::FAILED), "Failed");
}

TEST_F(PipelineTest, SubmitRegistersFunction)
{
  auto zip = archive({{"app.py", "print('hi')"}});

  EXPECT_CALL(builder, build(_, _, std::chrono::milliseconds{5s}))
      .WillOnce(Invoke(
          [](const std::filesystem::path& root, const HandlerDescriptor& handler,
             std::chrono::milliseconds) {
            EXPECT_TRUE(std::filesystem::exists(root / "app.py"));
            EXPECT_EQ(handler.entry_point, "app.py");
            EXPECT_EQ(handler.language, Language::PYTHON);
            return std::string{"sha256:1234"};
          }
      ));

  auto metadata = submit(zip, "hello");

  EXPECT_EQ(metadata.image_id, "sha256:1234");
  EXPECT_EQ(metadata.name, "hello");
  EXPECT_EQ(metadata.language, Language::PYTHON);
  EXPECT_TRUE(faasbox::common::UUID::valid(metadata.function_id));
  EXPECT_FALSE(metadata.last_executed.has_value());

  auto stored = registry.get(metadata.function_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->image_id, "sha256:1234");
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitDefaultName)
{
  auto zip = archive({{"main.go", "package main"}});
  EXPECT_CALL(builder, build(_, _, _)).WillOnce(Return("faasbox:golang-1"));

  auto metadata = submit(zip);

  EXPECT_EQ(metadata.name, Pipeline::DEFAULT_FUNCTION_NAME);
  EXPECT_EQ(metadata.language, Language::GOLANG);
}

TEST_F(PipelineTest, SubmitNoHandler)
{
  auto zip = archive({{"README.md", "docs"}});
  EXPECT_CALL(builder, build(_, _, _)).Times(0);

  EXPECT_THROW(submit(zip), faasbox::common::NoHandlerFound);
  EXPECT_EQ(registry.size(), 0);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitManifestUnsupportedLanguage)
{
  auto zip = archive(
      {{"serverless.json", R"({"handler": "index.js", "language": "javascript"})"},
       {"index.js", "console.log('hi')"},
       {"main.py", "print('hi')"}}
  );
  EXPECT_CALL(builder, build(_, _, _)).Times(0);

  EXPECT_THROW(submit(zip), faasbox::common::UnsupportedLanguage);
  EXPECT_EQ(registry.size(), 0);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitTooLarge)
{
  pipeline = std::make_unique<Pipeline>(Options{base.string(), 10, 5s, 3s}, builder, runner, registry);
  auto zip = archive({{"app.py", "print('hi')"}});
  EXPECT_CALL(builder, build(_, _, _)).Times(0);

  EXPECT_THROW(submit(zip), faasbox::common::UploadTooLarge);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitCorruptedArchive)
{
  auto path = scratch.path() / "broken.zip";
  write_file(path, std::string(600, '\xff'));
  EXPECT_CALL(builder, build(_, _, _)).Times(0);

  EXPECT_THROW(submit(path), faasbox::common::ResourceError);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitBuildFailure)
{
  auto zip = archive({{"app.py", "print('hi')"}});
  EXPECT_CALL(builder, build(_, _, _))
      .WillOnce(Throw(faasbox::common::BuildFailed{"docker build failed", "syntax error"}));

  try {
    submit(zip);
    FAIL() << "Expected BuildFailed";
  } catch (faasbox::common::BuildFailed& exc) {
    EXPECT_EQ(exc.output(), "syntax error");
  }
  EXPECT_EQ(registry.size(), 0);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitBuildTimeout)
{
  auto zip = archive({{"app.py", "print('hi')"}});
  EXPECT_CALL(builder, build(_, _, _))
      .WillOnce(Throw(faasbox::common::TimeoutError{"image build timed out after 5s"}));

  EXPECT_THROW(submit(zip), faasbox::common::TimeoutError);
  EXPECT_EQ(registry.size(), 0);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, SubmitUnexpectedFailureBecomesResourceError)
{
  auto zip = archive({{"app.py", "print('hi')"}});
  EXPECT_CALL(builder, build(_, _, _)).WillOnce(Throw(std::runtime_error{"unexpected"}));

  EXPECT_THROW(submit(zip), faasbox::common::ResourceError);
  EXPECT_TRUE(clean());
}

TEST_F(PipelineTest, ExecuteRecordsTimestamp)
{
  registry.store(FunctionMetadata{"fn", "sha256:abc", Language::PYTHON, 100, std::nullopt, "f"});

  ExecutionInput input{{"name", "faasbox"}};
  EXPECT_CALL(runner, run("sha256:abc", input, std::chrono::milliseconds{3s}))
      .WillOnce(Return("Hello, faasbox!\n"));

  auto result = pipeline->execute("fn", input, "req-2");

  EXPECT_EQ(result.output, "Hello, faasbox!\n");
  EXPECT_EQ(registry.get("fn")->last_executed, result.executed_at);
}

TEST_F(PipelineTest, ExecuteUnknownFunction)
{
  registry.store(FunctionMetadata{"fn", "sha256:abc", Language::PYTHON, 100, std::nullopt, "f"});
  EXPECT_CALL(runner, run(_, _, _)).Times(0);

  EXPECT_THROW(pipeline->execute("missing", {}, "req-3"), faasbox::common::ObjectDoesNotExist);
  EXPECT_THROW(pipeline->execute("", {}, "req-3"), faasbox::common::InvalidRequest);
  EXPECT_EQ(registry.size(), 1);

  // The stored function is untouched.
  auto stored = registry.get("fn");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->image_id, "sha256:abc");
  EXPECT_EQ(stored->created_at, 100);
  EXPECT_FALSE(stored->last_executed.has_value());
}

TEST_F(PipelineTest, ExecuteEmptyInputName)
{
  registry.store(FunctionMetadata{"fn", "sha256:abc", Language::PYTHON, 100, std::nullopt, "f"});
  EXPECT_CALL(runner, run(_, _, _)).Times(0);

  EXPECT_THROW(
      pipeline->execute("fn", {{"", "x"}, {"name", "y"}}, "req-8"),
      faasbox::common::InvalidRequest
  );
  EXPECT_FALSE(registry.get("fn")->last_executed.has_value());
}

TEST_F(PipelineTest, ExecuteFailureLeavesTimestamp)
{
  registry.store(FunctionMetadata{"fn", "sha256:abc", Language::PYTHON, 100, std::nullopt, "f"});
  EXPECT_CALL(runner, run(_, _, _))
      .WillOnce(Throw(faasbox::common::ExecutionFailed{"exit code 1", "Traceback"}));

  EXPECT_THROW(pipeline->execute("fn", {}, "req-4"), faasbox::common::ExecutionFailed);
  EXPECT_FALSE(registry.get("fn")->last_executed.has_value());
}

TEST_F(PipelineTest, ExecuteAfterConcurrentDeletion)
{
  registry.store(FunctionMetadata{"fn", "sha256:abc", Language::PYTHON, 100, std::nullopt, "f"});
  EXPECT_CALL(runner, run(_, _, _)).WillOnce(Invoke([this](auto&&...) {
    registry.remove("fn");
    return std::string{"done"};
  }));

  // Bookkeeping failures never fail the execution.
  auto result = pipeline->execute("fn", {}, "req-5");
  EXPECT_EQ(result.output, "done");
}

TEST_F(PipelineTest, GetListRemove)
{
  registry.store(FunctionMetadata{"a", "sha256:a", Language::PYTHON, 100, std::nullopt, "a"});
  registry.store(FunctionMetadata{"b", "sha256:b", Language::GOLANG, 200, std::nullopt, "b"});

  EXPECT_EQ(pipeline->list().size(), 2);
  EXPECT_EQ(pipeline->get("b").language, Language::GOLANG);
  EXPECT_THROW(pipeline->get("c"), faasbox::common::ObjectDoesNotExist);

  EXPECT_CALL(builder, remove("sha256:a")).Times(1);
  pipeline->remove("a", "req-6");
  EXPECT_FALSE(registry.get("a").has_value());

  EXPECT_THROW(pipeline->remove("a", "req-7"), faasbox::common::ObjectDoesNotExist);
}
