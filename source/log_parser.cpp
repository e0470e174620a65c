#include <devsup/log_parser.hpp>

#include <cctype>
#include <regex>

namespace devsup {

using nlohmann::json;

static std::string_view trim_view(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

// Removes and returns the first of `keys` present in `obj`.
static std::optional<json> take_first(json& obj,
                                      std::initializer_list<const char *> keys) {
  std::optional<json> found;
  for (const char *k : keys) {
    auto it = obj.find(k);
    if (it == obj.end())
      continue;
    found = *it;
    obj.erase(it);
    break;
  }
  return found;
}

static LogEntry parse_json_line(json obj, const std::string& service,
                                const std::string& raw) {
  LogEntry e;
  e.service = service;
  e.raw = raw;

  e.timestamp = std::chrono::system_clock::now();
  if (auto ts = take_first(obj, {"timestamp", "time", "ts"}); ts && ts->is_string()) {
    if (auto tp = parse_rfc3339(ts->get<std::string>()))
      e.timestamp = *tp;
  }

  if (auto lv = take_first(obj, {"level", "severity"}); lv && lv->is_string()) {
    e.level = parse_log_level(lv->get<std::string>()).value_or(LogLevel::Info);
  }

  e.message = raw;
  if (auto msg = take_first(obj, {"message", "msg"}); msg && msg->is_string()) {
    e.message = msg->get<std::string>();
  }

  for (auto it = obj.begin(); it != obj.end(); ++it)
    e.fields[it.key()] = it.value();
  return e;
}

static LogEntry parse_text_line(const std::string& line,
                                const std::string& service) {
  static const std::regex ts_re(
      R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2})");
  static const std::regex level_re(R"(\b(TRACE|DEBUG|INFO|WARN|WARNING|ERROR)\b)",
                                   std::regex::icase);

  LogEntry e;
  e.service = service;
  e.raw = line;
  e.message = line;

  std::smatch m;
  std::optional<SystemTime> ts;
  if (std::regex_search(line, m, ts_re))
    ts = parse_datetime(m.str(0));
  e.timestamp = ts.value_or(std::chrono::system_clock::now());

  if (std::regex_search(line, m, level_re))
    e.level = parse_log_level(m.str(1)).value_or(LogLevel::Info);
  return e;
}

std::optional<LogEntry> parse_log_line(std::string_view line,
                                       const std::string& service) {
  auto trimmed = trim_view(line);
  if (trimmed.empty())
    return std::nullopt;
  std::string raw(trimmed);

  if (raw.front() == '{') {
    json j = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_object())
      return parse_json_line(std::move(j), service, raw);
  }
  return parse_text_line(raw, service);
}

json to_json(const LogEntry& e) {
  json fields = json::object();
  for (auto &[k, v] : e.fields)
    fields[k] = v;
  return json{{"timestamp", format_rfc3339(e.timestamp)},
              {"service", e.service},
              {"level", to_string(e.level)},
              {"message", e.message},
              {"fields", std::move(fields)},
              {"raw", e.raw}};
}

} // namespace devsup
