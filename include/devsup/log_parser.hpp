#pragma once
#include "timefmt.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace devsup {

struct LogEntry {
  SystemTime timestamp;
  std::string service;
  LogLevel level = LogLevel::Info;
  std::string message;
  std::map<std::string, nlohmann::json> fields; // non-standard JSON keys
  std::string raw;
};

nlohmann::json to_json(const LogEntry& e);

// Lenient classifier. Blank lines give nullopt; anything else gives an entry,
// falling back to "now" / Info / the raw line.
std::optional<LogEntry> parse_log_line(std::string_view line,
                                       const std::string& service);

} // namespace devsup
