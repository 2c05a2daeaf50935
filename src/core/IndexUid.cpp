#include "uuidres/IndexUid.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace uuidres {

bool isIndexUidValid(const std::string& uid) {
  if (uid.empty()) return false;
  return std::all_of(uid.begin(), uid.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
  });
}

Uuid newUuidV4() {
  // random_generator is not thread-safe; one per thread.
  static thread_local boost::uuids::random_generator gen;
  return gen();
}

std::optional<Uuid> uuidFromBytes(const void* data, std::size_t size) {
  Uuid u{};
  if (!data || size != u.size()) return std::nullopt;
  const auto* p = static_cast<const unsigned char*>(data);
  std::copy(p, p + size, u.begin());
  return u;
}

std::optional<Uuid> parseUuid(const std::string& text) {
  try {
    return boost::uuids::string_generator()(text);
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

std::string toString(const Uuid& uuid) {
  return boost::uuids::to_string(uuid);
}

} // namespace uuidres
