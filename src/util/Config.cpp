#include "uuidres/util/Config.hpp"
#include "uuidres/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace uuidres {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

std::uint64_t Config::parseCount(const std::string& v) {
  // signed parse so "-1" clamps instead of wrapping to a huge bound
  long long n = std::strtoll(v.c_str(), nullptr, 10);
  return n < 1 ? 1u : static_cast<std::uint64_t>(n);
}

bool Config::parseBool(const std::string& v) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue;

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if      (key == "dataDir")       dataDir       = val;
    else if (key == "mapSize")       mapSize       = parseCount(val);
    else if (key == "inboxCapacity") inboxCapacity = static_cast<std::size_t>(parseCount(val));
    else if (key == "storeThreads")  storeThreads  = static_cast<unsigned>(parseCount(val));
    else if (key == "logLevel")      logLevel      = val;
    else if (key == "logJson")       logJson       = parseBool(val);
    else if (key == "logFile")       logFile       = val;
    else {
      // Unknown key; ignore to stay forward-compatible
    }
  }

  std::fclose(f);

  if (dataDir.empty()) dataDir = "./data.ms";
  return true;
}

void Config::applyLogging() const {
  auto& L = logger();
  L.setLevel(parseLevel(logLevel));
  L.setFormatJson(logJson);
  if (!L.setFile(logFile)) {
    L.log(LogLevel::Warn, "cannot open log file, using stdout", {{"path", logFile}});
  }
}

} // namespace util
} // namespace uuidres
