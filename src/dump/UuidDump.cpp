#include "uuidres/dump/UuidDump.hpp"
#include "uuidres/resolver/UuidResolverHandle.hpp"
#include "uuidres/util/Logger.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>

namespace uuidres::dump {

namespace {

Error badDump(const std::string& path, std::size_t line, const std::string& why) {
  return Error{ErrorCode::BadDump, path + ":" + std::to_string(line) + ": " + why};
}

} // namespace

Result<void> dumpEntries(const std::vector<IndexEntry>& entries, const std::string& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return Error{ErrorCode::BadDump, "cannot open " + path + " for writing"};

  for (const auto& e : entries) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    w.StartObject();
    w.Key("uid");
    w.String(e.name.c_str(), static_cast<rapidjson::SizeType>(e.name.size()));
    w.Key("uuid");
    std::string u = toString(e.uuid);
    w.String(u.c_str(), static_cast<rapidjson::SizeType>(u.size()));
    w.EndObject();
    out.write(sb.GetString(), static_cast<std::streamsize>(sb.GetSize()));
    out.put('\n');
  }

  out.flush();
  if (!out) return Error{ErrorCode::BadDump, "write to " + path + " failed"};
  return {};
}

Result<std::vector<IndexEntry>> loadEntries(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return Error{ErrorCode::BadDump, "cannot open " + path};

  std::vector<IndexEntry> entries;
  std::string line;
  std::size_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    rapidjson::Document d;
    d.Parse(line.c_str(), line.size());
    if (d.HasParseError()) {
      return badDump(path, lineNo, rapidjson::GetParseError_En(d.GetParseError()));
    }
    if (!d.IsObject()) return badDump(path, lineNo, "expected an object");
    if (!d.HasMember("uid") || !d["uid"].IsString()) {
      return badDump(path, lineNo, "missing string field 'uid'");
    }
    if (!d.HasMember("uuid") || !d["uuid"].IsString()) {
      return badDump(path, lineNo, "missing string field 'uuid'");
    }

    std::string uid(d["uid"].GetString(), d["uid"].GetStringLength());
    auto uuid = parseUuid(d["uuid"].GetString());
    if (!uuid) return badDump(path, lineNo, "invalid uuid for '" + uid + "'");

    entries.push_back(IndexEntry{std::move(uid), *uuid});
  }
  return entries;
}

Result<std::size_t> dumpResolver(const resolver::UuidResolverHandle& handle, const std::string& path) {
  auto entries = handle.list();
  if (!entries) return entries.error();

  auto written = dumpEntries(*entries, path);
  if (!written) return written.error();

  util::logger().log(util::LogLevel::Info, "uuid table dumped",
                     {{"path", path}, {"entries", std::to_string(entries.value().size())}});
  return entries.value().size();
}

Result<std::size_t> restoreResolver(const resolver::UuidResolverHandle& handle, const std::string& path) {
  auto entries = loadEntries(path);
  if (!entries) return entries.error();

  std::size_t restored = 0;
  for (auto& e : *entries) {
    auto r = handle.insert(e.name, e.uuid);
    if (!r) return r.error();
    ++restored;
  }

  util::logger().log(util::LogLevel::Info, "uuid table restored",
                     {{"path", path}, {"entries", std::to_string(restored)}});
  return restored;
}

} // namespace uuidres::dump
