#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace devsup {

enum class RestartPolicy { Never, OnFailure, Always, UnlessStopped };

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error };

struct ProcessState {
  enum class Kind { Starting, Running, Stopping, Stopped, Failed, Restarting };

  Kind kind = Kind::Stopped;
  std::string reason; // only for Failed

  static ProcessState starting() { return {Kind::Starting, {}}; }
  static ProcessState running() { return {Kind::Running, {}}; }
  static ProcessState stopping() { return {Kind::Stopping, {}}; }
  static ProcessState stopped() { return {Kind::Stopped, {}}; }
  static ProcessState restarting() { return {Kind::Restarting, {}}; }
  static ProcessState failed(std::string why) {
    return {Kind::Failed, std::move(why)};
  }

  bool is(Kind k) const { return kind == k; }
  bool operator==(const ProcessState& o) const {
    return kind == o.kind && reason == o.reason;
  }
  bool operator!=(const ProcessState& o) const { return !(*this == o); }
};

// Shared by Supervisor and HealthMonitor.
struct HealthStatus {
  enum class Kind { Unknown, Healthy, Degraded, Unhealthy };

  Kind kind = Kind::Unknown;
  std::string reason; // Degraded / Unhealthy

  static HealthStatus unknown() { return {Kind::Unknown, {}}; }
  static HealthStatus healthy() { return {Kind::Healthy, {}}; }
  static HealthStatus degraded(std::string why) {
    return {Kind::Degraded, std::move(why)};
  }
  static HealthStatus unhealthy(std::string why) {
    return {Kind::Unhealthy, std::move(why)};
  }

  bool is(Kind k) const { return kind == k; }
  bool operator==(const HealthStatus& o) const {
    return kind == o.kind && reason == o.reason;
  }
  bool operator!=(const HealthStatus& o) const { return !(*this == o); }
};

std::string to_string(RestartPolicy p);
std::string to_string(LogLevel l);
std::string to_string(const ProcessState& s);
std::string to_string(const HealthStatus& h);

std::optional<RestartPolicy> parse_restart_policy(std::string_view v);
// TRACE/DEBUG/INFO/WARN|WARNING/ERROR, case-insensitive.
std::optional<LogLevel> parse_log_level(std::string_view v);

} // namespace devsup
