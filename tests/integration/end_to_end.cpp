#include <faasbox/common/exceptions.hpp>
#include <faasbox/pipeline/builder.hpp>
#include <faasbox/pipeline/pipeline.hpp>
#include <faasbox/pipeline/registry.hpp>
#include <faasbox/pipeline/sandbox.hpp>
#include <faasbox/pipeline/subprocess.hpp>
#include <faasbox/pipeline/workdir.hpp>

#include "helpers.hpp"

#include <sstream>

#include <gtest/gtest.h>
#include <json/reader.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

using namespace faasbox::pipeline;
using namespace std::chrono_literals;

// Requires a reachable docker daemon and network access for base images.
class IntegrationDocker : public ::testing::Test {
protected:
  void SetUp() override
  {
    try {
      auto result = Subprocess::run({"docker", "info"}, 30s);
      if (!result.success()) {
        GTEST_SKIP() << "Docker daemon is not available";
      }
    } catch (faasbox::common::ResourceError& exc) {
      GTEST_SKIP() << "Docker client is not available: " << exc.what();
    }
    spdlog::set_level(spdlog::level::debug);
  }

  std::filesystem::path package(const std::string& example)
  {
    std::vector<ZipEntry> entries;
    std::filesystem::path root = std::filesystem::path{FAASBOX_EXAMPLES_DIR} / example;
    for (const auto& entry : std::filesystem::recursive_directory_iterator{root}) {
      if (entry.is_regular_file()) {
        entries.push_back(
            {std::filesystem::relative(entry.path(), root).string(), read_file(entry.path())}
        );
      }
    }

    auto path = scratch.path() / (example + ".zip");
    write_zip(path, entries);
    return path;
  }

  WorkingDirectory scratch;
  DockerImageBuilder builder{"docker", "faasbox-test", FAASBOX_TEMPLATES_DIR};
  DockerSandboxRunner runner{"docker"};
  FunctionTable registry;
  Pipeline pipeline{Options{"", 10 * 1024 * 1024, 600s, 60s}, builder, runner, registry};
};

TEST_F(IntegrationDocker, PythonFunction)
{
  auto zip = package("hello-python");

  FunctionMetadata metadata;
  {
    std::ifstream in{zip, std::ios::binary};
    metadata = pipeline.submit("hello-python.zip", in, "hello", "integration");
  }
  EXPECT_EQ(metadata.language, Language::PYTHON);
  EXPECT_FALSE(metadata.image_id.empty());

  auto result = pipeline.execute(metadata.function_id, {{"name", "faasbox"}}, "integration");

  Json::Value json;
  std::string errors;
  std::istringstream stream{result.output};
  ASSERT_TRUE(Json::parseFromStream(Json::CharReaderBuilder{}, stream, &json, &errors))
      << result.output;
  EXPECT_EQ(json["message"].asString(), "Hello, faasbox!");
  EXPECT_TRUE(registry.get(metadata.function_id)->last_executed.has_value());

  pipeline.remove(metadata.function_id, "integration");
  EXPECT_EQ(registry.size(), 0);
}

TEST_F(IntegrationDocker, GoFunction)
{
  auto zip = package("hello-go");

  std::ifstream in{zip, std::ios::binary};
  auto metadata = pipeline.submit("hello-go.zip", in, "", "integration");
  EXPECT_EQ(metadata.language, Language::GOLANG);

  auto result = pipeline.execute(metadata.function_id, {}, "integration");
  EXPECT_FALSE(result.output.empty());

  pipeline.remove(metadata.function_id, "integration");
}

TEST_F(IntegrationDocker, PythonFunctionWithoutManifest)
{
  auto zip = scratch.path() / "app.zip";
  write_zip(zip, {{"app.py", "print('Hello from app')\n"}});

  std::ifstream in{zip, std::ios::binary};
  auto metadata = pipeline.submit("app.zip", in, "", "integration");
  EXPECT_EQ(metadata.language, Language::PYTHON);

  auto result = pipeline.execute(metadata.function_id, {}, "integration");
  EXPECT_NE(result.output.find("Hello from app"), std::string::npos) << result.output;
  EXPECT_TRUE(registry.get(metadata.function_id)->last_executed.has_value());

  pipeline.remove(metadata.function_id, "integration");
  EXPECT_EQ(registry.size(), 0);
}
