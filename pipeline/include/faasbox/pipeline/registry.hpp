#ifndef FAASBOX_PIPELINE_REGISTRY_HPP
#define FAASBOX_PIPELINE_REGISTRY_HPP

#include <faasbox/pipeline/function.hpp>

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace faasbox::pipeline {

  struct Registry {

    Registry() = default;
    Registry(const Registry&) = default;
    Registry(Registry&&) = delete;
    Registry& operator=(const Registry&) = default;
    Registry& operator=(Registry&&) = delete;
    virtual ~Registry() = default;

    // Inserts or replaces the metadata under its function identifier.
    virtual void store(const FunctionMetadata& metadata) = 0;

    virtual std::optional<FunctionMetadata> get(const std::string& function_id) const = 0;

    // Returns false when the function does not exist.
    virtual bool mark_executed(const std::string& function_id, long when) = 0;

    virtual std::vector<FunctionMetadata> list() const = 0;

    virtual bool remove(const std::string& function_id) = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief In-memory registry of deployed functions.
  ///
  /// All operations take a single reader/writer lock; readers run concurrently.
  ////////////////////////////////////////////////////////////////////////////////
  class FunctionTable : public Registry {
  public:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    void store(const FunctionMetadata& metadata) override;

    std::optional<FunctionMetadata> get(const std::string& function_id) const override;

    bool mark_executed(const std::string& function_id, long when) override;

    // Ordered by creation time, then identifier.
    std::vector<FunctionMetadata> list() const override;

    bool remove(const std::string& function_id) override;

    size_t size() const;

  private:
    mutable lock_t _mutex;
    std::unordered_map<std::string, FunctionMetadata> _functions;
  };

} // namespace faasbox::pipeline

#endif
