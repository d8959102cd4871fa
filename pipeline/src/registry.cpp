#include <faasbox/pipeline/registry.hpp>

#include <algorithm>

namespace faasbox::pipeline {

  void FunctionTable::store(const FunctionMetadata& metadata)
  {
    write_lock_t lock{_mutex};
    _functions.insert_or_assign(metadata.function_id, metadata);
  }

  std::optional<FunctionMetadata> FunctionTable::get(const std::string& function_id) const
  {
    read_lock_t lock{_mutex};
    auto it = _functions.find(function_id);
    if (it == _functions.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool FunctionTable::mark_executed(const std::string& function_id, long when)
  {
    write_lock_t lock{_mutex};
    auto it = _functions.find(function_id);
    if (it == _functions.end()) {
      return false;
    }
    it->second.last_executed = when;
    return true;
  }

  std::vector<FunctionMetadata> FunctionTable::list() const
  {
    std::vector<FunctionMetadata> functions;
    {
      read_lock_t lock{_mutex};
      functions.reserve(_functions.size());
      for (const auto& [id, metadata] : _functions) {
        functions.push_back(metadata);
      }
    }

    std::sort(
        functions.begin(), functions.end(),
        [](const FunctionMetadata& a, const FunctionMetadata& b) {
          if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
          }
          return a.function_id < b.function_id;
        }
    );
    return functions;
  }

  bool FunctionTable::remove(const std::string& function_id)
  {
    write_lock_t lock{_mutex};
    return _functions.erase(function_id) > 0;
  }

  size_t FunctionTable::size() const
  {
    read_lock_t lock{_mutex};
    return _functions.size();
  }

} // namespace faasbox::pipeline
