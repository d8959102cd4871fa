#ifndef FAASBOX_COMMON_UUID_HPP
#define FAASBOX_COMMON_UUID_HPP

#include <mutex>
#include <random>
#include <string>

#include <uuid.h>

namespace faasbox::common {

  // Generates random (version 4) identifiers for deployed functions.
  // The generator is shared between worker threads.
  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    uuids::uuid generate()
    {
      std::lock_guard<std::mutex> lock{_mutex};
      return _uuid_generator();
    }

    std::string generate_str()
    {
      return uuids::to_string(generate());
    }

    static bool valid(const std::string& str)
    {
      return uuids::uuid::is_valid_uuid(str);
    }

  private:
    std::mutex _mutex;
    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
  };

} // namespace faasbox::common

#endif
