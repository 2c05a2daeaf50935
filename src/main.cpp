// File: src/main.cpp
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"
#include "uuidres/dump/UuidDump.hpp"
#include "uuidres/resolver/UuidResolverHandle.hpp"
#include "uuidres/store/SqliteDb.hpp"
#include "uuidres/util/Config.hpp"
#include "uuidres/util/Logger.hpp"

using uuidres::Error;
using uuidres::Result;
using uuidres::resolver::UuidResolverHandle;

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void usage() {
  std::cerr <<
    "usage: uuidres [--config <file>] <command> [args]\n"
    "commands:\n"
    "  create <uid>\n"
    "  get <uid>\n"
    "  delete <uid>\n"
    "  list\n"
    "  insert <uid> <uuid>\n"
    "  dump <file>\n"
    "  restore <file>\n";
}

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void writeEntry(JsonWriter& w, const std::string& uid, const uuidres::Uuid& uuid) {
  w.StartObject();
  w.Key("uid");  writeString(w, uid);
  w.Key("uuid"); writeString(w, uuidres::toString(uuid));
  w.EndObject();
}

int printError(const Error& err) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("error");
  w.StartObject();
  w.Key("code");    w.String(uuidres::errorCodeName(err.code));
  w.Key("message"); writeString(w, err.message);
  w.EndObject();
  w.EndObject();
  std::cerr << sb.GetString() << "\n";
  return kExitError;
}

void printJson(const rapidjson::StringBuffer& sb) {
  std::cout << sb.GetString() << "\n";
}

int printUuid(const std::string& uid, const Result<uuidres::Uuid>& r) {
  if (!r) return printError(r.error());
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeEntry(w, uid, *r);
  printJson(sb);
  return kExitOk;
}

int printCount(const char* key, const Result<std::size_t>& r) {
  if (!r) return printError(r.error());
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key(key); w.Uint64(*r);
  w.EndObject();
  printJson(sb);
  return kExitOk;
}

int run(const UuidResolverHandle& h, const std::vector<std::string>& args) {
  const std::string& cmd = args[0];
  auto want = [&](std::size_t n) { return args.size() == n + 1; };

  if (cmd == "create" && want(1)) return printUuid(args[1], h.create(args[1]));
  if (cmd == "get"    && want(1)) return printUuid(args[1], h.get(args[1]));
  if (cmd == "delete" && want(1)) return printUuid(args[1], h.remove(args[1]));

  if (cmd == "list" && want(0)) {
    auto r = h.list();
    if (!r) return printError(r.error());
    rapidjson::StringBuffer sb;
    JsonWriter w(sb);
    w.StartArray();
    for (auto& e : *r) writeEntry(w, e.name, e.uuid);
    w.EndArray();
    printJson(sb);
    return kExitOk;
  }

  if (cmd == "insert" && want(2)) {
    auto uuid = uuidres::parseUuid(args[2]);
    if (!uuid) {
      std::cerr << "invalid uuid '" << args[2] << "'\n";
      return kExitUsage;
    }
    auto r = h.insert(args[1], *uuid);
    if (!r) return printError(r.error());
    rapidjson::StringBuffer sb;
    JsonWriter w(sb);
    writeEntry(w, args[1], *uuid);
    printJson(sb);
    return kExitOk;
  }

  if (cmd == "dump"    && want(1)) return printCount("dumped", uuidres::dump::dumpResolver(h, args[1]));
  if (cmd == "restore" && want(1)) return printCount("restored", uuidres::dump::restoreResolver(h, args[1]));

  usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace uuidres::util;

  // ---------------------------
  // 1) Arguments / config
  // ---------------------------
  Config cfg;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" || a == "-c") {
      if (i + 1 >= argc) { usage(); return kExitUsage; }
      std::string path = argv[++i];
      if (!cfg.loadFromFile(path)) {
        std::cerr << "[config] failed to load file: " << path << "\n";
        return kExitUsage;
      }
    } else if (a == "--help" || a == "-h") {
      usage();
      return kExitOk;
    } else {
      args.push_back(std::move(a));
    }
  }
  if (args.empty()) { usage(); return kExitUsage; }

  // stdout carries the command result
  if (cfg.logFile.empty()) cfg.logFile = "-";
  cfg.applyLogging();

  logger().log(LogLevel::Debug, "boot", {{"dataDir", cfg.dataDir}, {"cmd", args[0]}});

  // ---------------------------
  // 2) Registry
  // ---------------------------
  try {
    UuidResolverHandle handle = UuidResolverHandle::open(cfg);
    return run(handle, args);
  } catch (const uuidres::store::StoreError& ex) {
    logger().log(LogLevel::Error, "cannot open uuid store",
                 {{"what", ex.what()}, {"rc", std::to_string(ex.code())}});
    return printError(Error{uuidres::ErrorCode::Storage, ex.what()});
  } catch (const uuidres::resolver::ResolverTerminated& ex) {
    logger().log(LogLevel::Error, "uuid resolver terminated", {{"what", ex.what()}});
    return EXIT_FAILURE;
  }
}
