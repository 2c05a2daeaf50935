#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace uuidres {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Push logLevel/logJson/logFile into the process logger.
  void applyLogging() const;

  // Root data directory; the registry lives in <dataDir>/index_uuids.
  std::string   dataDir       = "./data.ms";
  std::uint64_t mapSize       = 1073741824; // 1 GiB cap on the store file
  std::size_t   inboxCapacity = 100;        // resolver queue bound
  unsigned      storeThreads  = 2;          // worker pool for store transactions

  std::string   logLevel      = "info";
  bool          logJson       = false;
  std::string   logFile;                    // empty -> stdout

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& v);
  // Integer >= 1; anything smaller (including negatives) clamps to 1.
  static std::uint64_t parseCount(const std::string& v);
};

} // namespace util
} // namespace uuidres
