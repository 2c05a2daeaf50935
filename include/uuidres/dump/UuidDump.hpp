#pragma once

#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace uuidres::resolver { class UuidResolverHandle; }

namespace uuidres::dump {

// JSON-lines export of the uid -> uuid table, one entry per line:
//   {"uid":"movies","uuid":"2e7f6b0c-..."}

Result<void> dumpEntries(const std::vector<IndexEntry>& entries, const std::string& path);

// BadDump on unreadable file, malformed line, missing field or bad uuid text.
Result<std::vector<IndexEntry>> loadEntries(const std::string& path);

// list() the resolver into `path`. Returns the number of entries written.
Result<std::size_t> dumpResolver(const resolver::UuidResolverHandle& handle, const std::string& path);

// insert() every entry of `path`, stopping at the first failure.
// Returns the number of entries restored.
Result<std::size_t> restoreResolver(const resolver::UuidResolverHandle& handle, const std::string& path);

} // namespace uuidres::dump
