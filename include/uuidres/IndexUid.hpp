#pragma once

#include <boost/uuid/uuid.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace uuidres {

using Uuid = boost::uuids::uuid;

/// A persisted (index uid, uuid) pair.
struct IndexEntry {
  std::string name;
  Uuid        uuid;
};

inline bool operator==(const IndexEntry& a, const IndexEntry& b) {
  return a.name == b.name && a.uuid == b.uuid;
}

/// True when every character of `uid` is ASCII alphanumeric, '-' or '_'
/// and `uid` is not empty.
bool isIndexUidValid(const std::string& uid);

/// Fresh random (version 4) uuid. Safe to call from any thread.
Uuid newUuidV4();

/// Raw 16-byte decoding; nullopt when `size` is not 16.
std::optional<Uuid> uuidFromBytes(const void* data, std::size_t size);

/// Hyphenated 8-4-4-4-12 text; nullopt on malformed input.
std::optional<Uuid> parseUuid(const std::string& text);

std::string toString(const Uuid& uuid);

} // namespace uuidres
