#include <devsup/types.hpp>

#include <algorithm>
#include <cctype>

namespace devsup {

static std::string lower(std::string_view v) {
  std::string s(v);
  for (auto& ch : s)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

std::string to_string(RestartPolicy p) {
  switch (p) {
  case RestartPolicy::Never: return "never";
  case RestartPolicy::OnFailure: return "on-failure";
  case RestartPolicy::Always: return "always";
  case RestartPolicy::UnlessStopped: return "unless-stopped";
  }
  return "never";
}

std::string to_string(LogLevel l) {
  switch (l) {
  case LogLevel::Trace: return "TRACE";
  case LogLevel::Debug: return "DEBUG";
  case LogLevel::Info: return "INFO";
  case LogLevel::Warn: return "WARN";
  case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

std::string to_string(const ProcessState& s) {
  using K = ProcessState::Kind;
  switch (s.kind) {
  case K::Starting: return "starting";
  case K::Running: return "running";
  case K::Stopping: return "stopping";
  case K::Stopped: return "stopped";
  case K::Restarting: return "restarting";
  case K::Failed: return "failed: " + s.reason;
  }
  return "unknown";
}

std::string to_string(const HealthStatus& h) {
  using K = HealthStatus::Kind;
  switch (h.kind) {
  case K::Unknown: return "unknown";
  case K::Healthy: return "healthy";
  case K::Degraded: return "degraded: " + h.reason;
  case K::Unhealthy: return "unhealthy: " + h.reason;
  }
  return "unknown";
}

std::optional<RestartPolicy> parse_restart_policy(std::string_view v) {
  auto s = lower(v);
  if (s == "always") return RestartPolicy::Always;
  if (s == "on-failure" || s == "onfailure") return RestartPolicy::OnFailure;
  if (s == "unless-stopped" || s == "unlessstopped")
    return RestartPolicy::UnlessStopped;
  if (s == "never" || s == "no" || s == "false" || s == "0")
    return RestartPolicy::Never;
  return std::nullopt;
}

std::optional<LogLevel> parse_log_level(std::string_view v) {
  auto s = lower(v);
  if (s == "trace") return LogLevel::Trace;
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return std::nullopt;
}

} // namespace devsup
