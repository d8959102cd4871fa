#ifndef FAASBOX_PIPELINE_SANDBOX_HPP
#define FAASBOX_PIPELINE_SANDBOX_HPP

#include <faasbox/common/uuid.hpp>
#include <faasbox/pipeline/function.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <tbb/concurrent_hash_map.h>

namespace faasbox::pipeline {

  template <typename Value, typename Key = std::string>
  struct ConcurrentTable {

    // IntelTBB concurrent hash map, with a default string key
    using table_t = oneapi::tbb::concurrent_hash_map<Key, Value>;

    // Equivalent to receiving a read-write lock. Should be used only for
    // modifying contents.
    using rw_acc_t = typename oneapi::tbb::concurrent_hash_map<Key, Value>::accessor;

    // Read lock. Guarantees that data is safe to access, as long as we keep the
    // accessor.
    using ro_acc_t = typename oneapi::tbb::concurrent_hash_map<Key, Value>::const_accessor;
  };

  struct Container {

    std::string name{};

    std::string image{};

    std::chrono::steady_clock::time_point started{};
  };

  // Containers started by the runner that have not finished yet.
  struct Containers {

    using ro_acc_t = typename ConcurrentTable<Container>::ro_acc_t;
    using rw_acc_t = typename ConcurrentTable<Container>::rw_acc_t;

    void add(Container&& container);

    bool contains(const std::string& name) const;

    bool erase(const std::string& name);

    void get_all(std::vector<Container>& containers) const;

    size_t size() const;

  private:
    // Iterating the table is unsafe against concurrent erasure; point
    // operations share the lock, iteration holds it exclusively.
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;
    mutable lock_t _iteration_mutex;

    ConcurrentTable<Container>::table_t _containers;
  };

  struct SandboxRunner {

    SandboxRunner() = default;
    SandboxRunner(const SandboxRunner&) = default;
    SandboxRunner(SandboxRunner&&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = default;
    SandboxRunner& operator=(SandboxRunner&&) = delete;
    virtual ~SandboxRunner() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs the image once in an isolated container.
    ///
    /// @param[in] image image handle returned by the builder
    /// @param[in] input invocation parameters, passed as environment variables
    /// @param[in] timeout deadline of the whole container run
    /// @return combined stdout and stderr of the container
    /// @throws common::TimeoutError, common::ExecutionFailed
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::string
    run(const std::string& image, const ExecutionInput& input, std::chrono::milliseconds timeout) = 0;

    // Stops every container still running.
    virtual void shutdown() = 0;
  };

  class DockerSandboxRunner : public SandboxRunner {
  public:
    static constexpr char CONTAINER_PREFIX[] = "faasbox-";
    static constexpr char NETWORK[] = "bridge";
    static constexpr char DNS_SERVER[] = "8.8.8.8";
    static constexpr char MEMORY_LIMIT[] = "128m";
    static constexpr char CPU_LIMIT[] = "0.5";

    explicit DockerSandboxRunner(std::string docker_binary);

    std::string run(
        const std::string& image, const ExecutionInput& input, std::chrono::milliseconds timeout
    ) override;

    void shutdown() override;

    const Containers& containers() const
    {
      return _containers;
    }

    // Non-alphanumeric characters become underscores; the result is upper-cased.
    static std::string sanitize_env_name(const std::string& name);

    // Sanitized KEY=VALUE pairs; on a name collision the lexicographically last key wins.
    static std::vector<std::string> environment(const ExecutionInput& input);

    static std::vector<std::string> run_arguments(
        const std::string& docker_binary, const std::string& container_name,
        const std::string& image, const ExecutionInput& input
    );

  private:
    void _force_remove(const std::string& container_name);

    std::string _docker_binary;
    std::atomic<bool> _shutdown{false};

    Containers _containers;
    common::UUID _uuid_generator;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace faasbox::pipeline

#endif
