#include <faasbox/pipeline/subprocess.hpp>

#include <faasbox/common/exceptions.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace faasbox::pipeline {

  static constexpr size_t READ_BUFFER_SIZE = 4096;
  static constexpr std::chrono::milliseconds REAP_INTERVAL{10};

  Subprocess::Subprocess(std::vector<std::string> args, size_t output_limit)
      : _args(std::move(args)), _output_limit(output_limit)
  {
  }

  Subprocess::~Subprocess()
  {
    if (running()) {
      _kill();
      _reap();
    }
    if (_output_fd >= 0) {
      close(_output_fd);
    }
  }

  void Subprocess::start()
  {
    if (_args.empty()) {
      throw common::ResourceError{"cannot start a process without a command"};
    }

    // Everything the child touches must be prepared before the fork.
    std::vector<char*> argv;
    argv.reserve(_args.size() + 1);
    for (auto& arg : _args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::array<int, 2> fds{};
    if (pipe2(fds.data(), O_CLOEXEC) == -1) {
      throw common::ResourceError{
          fmt::format("Failed to create pipe, reason {} {}", errno, strerror(errno))};
    }

    int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (dev_null == -1) {
      close(fds[0]);
      close(fds[1]);
      throw common::ResourceError{
          fmt::format("Failed to open /dev/null, reason {} {}", errno, strerror(errno))};
    }

    int mypid = fork();
    if (mypid < 0) {
      close(fds[0]);
      close(fds[1]);
      close(dev_null);
      throw common::ResourceError{
          fmt::format("Fork failed! {}, reason {} {}", mypid, errno, strerror(errno))};
    }

    if (mypid == 0) {

      // Only async-signal-safe calls between fork and exec.
      setpgid(0, 0);
      dup2(dev_null, 0);
      dup2(fds[1], 1);
      dup2(fds[1], 2);

      execvp(argv[0], argv.data());

      static constexpr char msg[] = "failed to execute command\n";
      ssize_t ret = write(2, msg, sizeof(msg) - 1);
      (void)ret;
      _exit(EXEC_FAILURE_CODE);
    }

    // Both sides set the group to avoid a race with an early kill.
    setpgid(mypid, mypid);
    close(fds[1]);
    close(dev_null);

    _pid = mypid;
    _output_fd = fds[0];
    fcntl(_output_fd, F_SETFL, fcntl(_output_fd, F_GETFL) | O_NONBLOCK);

    SPDLOG_DEBUG("Started process {} with PID {}", _args[0], _pid);
  }

  ProcessResult Subprocess::wait(std::chrono::milliseconds timeout)
  {
    if (!running()) {
      throw common::ResourceError{"process is not running"};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    ProcessResult result;
    std::array<char, READ_BUFFER_SIZE> buffer{};

    // Drain output until EOF; the child may still hold the pipe after exit
    // through its descendants, so the deadline applies here too.
    bool eof = false;
    while (!eof) {

      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()
      );
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }

      // poll takes an int; longer deadlines are waited out in several rounds.
      auto poll_timeout = std::min<long long>(remaining.count(), std::numeric_limits<int>::max());
      pollfd pfd{_output_fd, POLLIN, 0};
      int ret = poll(&pfd, 1, static_cast<int>(poll_timeout));
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        spdlog::error("Polling process {} failed, reason {}", _pid, strerror(errno));
        result.timed_out = true;
        break;
      }
      if (ret == 0) {
        continue;
      }

      while (true) {
        ssize_t bytes = read(_output_fd, buffer.data(), buffer.size());
        if (bytes > 0) {
          size_t space = _output_limit - std::min(_output_limit, result.output.size());
          result.output.append(buffer.data(), std::min(space, static_cast<size_t>(bytes)));
          continue;
        }
        if (bytes == 0) {
          eof = true;
        } else if (errno == EINTR) {
          continue;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
          eof = true;
        }
        break;
      }
    }

    // Output closed; the process may still be running.
    while (!result.timed_out) {
      int status{};
      pid_t ret = waitpid(_pid, &status, WNOHANG);
      if (ret == _pid) {
        _pid = -1;
        if (WIFEXITED(status)) {
          result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
          result.exit_code = 128 + WTERMSIG(status);
        }
        break;
      }
      if (ret == -1 && errno != EINTR) {
        spdlog::error("Waiting for process {} failed, reason {}", _pid, strerror(errno));
        _pid = -1;
        result.exit_code = -1;
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.timed_out = true;
        break;
      }
      std::this_thread::sleep_for(REAP_INTERVAL);
    }

    if (result.timed_out) {
      spdlog::warn("Process {} exceeded its deadline, killing", _pid);
      _kill();
      result.exit_code = _reap();
    }

    close(_output_fd);
    _output_fd = -1;

    return result;
  }

  ProcessResult Subprocess::run(std::vector<std::string> args, std::chrono::milliseconds timeout)
  {
    Subprocess process{std::move(args)};
    process.start();
    return process.wait(timeout);
  }

  void Subprocess::_kill()
  {
    if (_pid <= 0) {
      return;
    }
    kill(-_pid, SIGKILL);
    kill(_pid, SIGKILL);
  }

  int Subprocess::_reap()
  {
    if (_pid <= 0) {
      return -1;
    }

    int status{};
    pid_t ret{};
    do {
      ret = waitpid(_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);
    _pid = -1;

    if (ret == -1) {
      return -1;
    }
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  }

} // namespace faasbox::pipeline
