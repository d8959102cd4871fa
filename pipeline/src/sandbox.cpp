#include <faasbox/pipeline/sandbox.hpp>

#include <faasbox/common/exceptions.hpp>
#include <faasbox/common/util.hpp>
#include <faasbox/pipeline/subprocess.hpp>

#include <cctype>
#include <map>

#include <fmt/format.h>

namespace faasbox::pipeline {

  static constexpr std::chrono::seconds REMOVAL_TIMEOUT{30};

  void Containers::add(Container&& container)
  {
    read_lock_t lock{_iteration_mutex};
    rw_acc_t acc;
    _containers.insert(acc, container.name);
    acc->second = std::move(container);
  }

  bool Containers::contains(const std::string& name) const
  {
    read_lock_t lock{_iteration_mutex};
    ro_acc_t acc;
    return _containers.find(acc, name);
  }

  bool Containers::erase(const std::string& name)
  {
    read_lock_t lock{_iteration_mutex};
    return _containers.erase(name);
  }

  void Containers::get_all(std::vector<Container>& containers) const
  {
    write_lock_t lock{_iteration_mutex};
    for (const auto& container : _containers) {
      containers.push_back(container.second);
    }
  }

  size_t Containers::size() const
  {
    return _containers.size();
  }

  DockerSandboxRunner::DockerSandboxRunner(std::string docker_binary)
      : _docker_binary(std::move(docker_binary))
  {
    _logger = common::util::create_logger("SandboxRunner");
  }

  std::string DockerSandboxRunner::run(
      const std::string& image, const ExecutionInput& input, std::chrono::milliseconds timeout
  )
  {
    if (_shutdown) {
      throw common::ResourceError{"sandbox runner is shutting down"};
    }

    std::string name = CONTAINER_PREFIX + _uuid_generator.generate_str();
    _containers.add(Container{name, image, std::chrono::steady_clock::now()});
    _logger->info("Starting container {} of image {}", name, image);

    ProcessResult result;
    try {
      Subprocess process{run_arguments(_docker_binary, name, image, input)};
      process.start();
      result = process.wait(timeout);
    } catch (common::FaasboxException&) {
      _containers.erase(name);
      throw;
    }
    _containers.erase(name);

    if (result.timed_out) {
      _logger->error("Container {} exceeded {}", name, common::util::format_duration(timeout));
      // Killing the client does not stop the container.
      _force_remove(name);
      throw common::TimeoutError{fmt::format(
          "function execution timed out after {}", common::util::format_duration(timeout)
      )};
    }

    if (result.exit_code != 0) {
      _logger->error("Container {} failed with status {}", name, result.exit_code);
      throw common::ExecutionFailed{
          fmt::format("function execution failed with exit code {}", result.exit_code),
          std::move(result.output)};
    }

    _logger->info("Container {} finished", name);
    return std::move(result.output);
  }

  void DockerSandboxRunner::shutdown()
  {
    _shutdown = true;

    std::vector<Container> containers;
    _containers.get_all(containers);
    _logger->info("Stopping {} running containers", containers.size());

    for (const auto& container : containers) {
      _force_remove(container.name);
    }
  }

  std::string DockerSandboxRunner::sanitize_env_name(const std::string& name)
  {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
      auto uc = static_cast<unsigned char>(c);
      result.push_back(std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_');
    }
    return result;
  }

  std::vector<std::string> DockerSandboxRunner::environment(const ExecutionInput& input)
  {
    // ExecutionInput iterates in key order, so later keys overwrite earlier ones.
    std::map<std::string, std::string> sanitized;
    for (const auto& [key, value] : input) {
      sanitized[sanitize_env_name(key)] = value;
    }

    std::vector<std::string> env;
    env.reserve(sanitized.size());
    for (const auto& [key, value] : sanitized) {
      env.push_back(fmt::format("{}={}", key, value));
    }
    return env;
  }

  std::vector<std::string> DockerSandboxRunner::run_arguments(
      const std::string& docker_binary, const std::string& container_name,
      const std::string& image, const ExecutionInput& input
  )
  {
    std::vector<std::string> args{
        docker_binary,
        "run",
        "--rm",
        "--name",
        container_name,
        fmt::format("--network={}", NETWORK),
        fmt::format("--dns={}", DNS_SERVER),
        "--cap-drop=ALL",
        "--security-opt=no-new-privileges",
        fmt::format("--memory={}", MEMORY_LIMIT),
        fmt::format("--cpus={}", CPU_LIMIT)};

    for (auto& var : environment(input)) {
      args.emplace_back("-e");
      args.push_back(std::move(var));
    }

    args.push_back(image);
    return args;
  }

  void DockerSandboxRunner::_force_remove(const std::string& container_name)
  {
    try {
      ProcessResult result =
          Subprocess::run({_docker_binary, "rm", "-f", container_name}, REMOVAL_TIMEOUT);
      if (!result.success()) {
        _logger->warn(
            "Removing container {} failed with status {}: {}", container_name, result.exit_code,
            result.output
        );
      }
    } catch (common::FaasboxException& exc) {
      _logger->warn("Removing container {} failed: {}", container_name, exc.what());
    }
  }

} // namespace faasbox::pipeline
