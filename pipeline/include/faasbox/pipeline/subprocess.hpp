#ifndef FAASBOX_PIPELINE_SUBPROCESS_HPP
#define FAASBOX_PIPELINE_SUBPROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace faasbox::pipeline {

  struct ProcessResult {
    // Exit status; 128 + signal number when the child was killed by a signal.
    int exit_code{};
    bool timed_out{};
    std::string output;

    bool success() const
    {
      return !timed_out && exit_code == 0;
    }
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief External process with combined stdout/stderr capture and a deadline.
  ///
  /// The child runs in its own process group. When the deadline expires, the
  /// whole group receives SIGKILL. The child is always reaped, either in wait()
  /// or in the destructor.
  ////////////////////////////////////////////////////////////////////////////////
  class Subprocess {
  public:
    static constexpr size_t DEFAULT_OUTPUT_LIMIT = 16 * 1024 * 1024;
    static constexpr int EXEC_FAILURE_CODE = 127;

    explicit Subprocess(std::vector<std::string> args, size_t output_limit = DEFAULT_OUTPUT_LIMIT);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    // Forks and executes the command; throws common::FaasboxException on failure.
    void start();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Collects output until the child exits or the timeout elapses.
    ///
    /// @param[in] timeout maximal wall-clock time counted from the call
    /// @return exit status, timeout flag and the captured output
    ////////////////////////////////////////////////////////////////////////////////
    ProcessResult wait(std::chrono::milliseconds timeout);

    pid_t pid() const
    {
      return _pid;
    }

    bool running() const
    {
      return _pid > 0;
    }

    static ProcessResult run(std::vector<std::string> args, std::chrono::milliseconds timeout);

  private:
    void _kill();
    int _reap();

    std::vector<std::string> _args;
    size_t _output_limit;

    pid_t _pid{-1};
    int _output_fd{-1};
  };

} // namespace faasbox::pipeline

#endif
