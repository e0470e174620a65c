#pragma once
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devsup {

struct HealthCheck {
  std::string endpoint;
  std::chrono::milliseconds interval{10000};
  std::chrono::milliseconds timeout{5000};
  std::uint32_t retries = 3;
};

struct ServiceHealth {
  std::string name;
  HealthStatus status;
  std::optional<std::chrono::system_clock::time_point> last_check;
  std::optional<std::chrono::milliseconds> response_time;
  std::uint32_t consecutive_failures = 0;
};

// 2xx -> Healthy, 5xx -> Unhealthy, anything else -> Degraded.
HealthStatus classify_http_status(int code);

// Standalone registry of HTTP checks, not tied to any supervised process.
// Safe to use from several threads; probes run without holding the lock.
class HealthMonitor {
public:
  void register_check(const std::string& name, HealthCheck check);

  // Exactly one GET. Throws NotFound for an unregistered name.
  HealthStatus check_one(const std::string& name);
  std::map<std::string, HealthStatus> check_all();

  std::vector<std::string> unhealthy_services() const;

  std::optional<ServiceHealth> get(const std::string& name) const;
  bool is_healthy(const std::string& name) const;
  // More consecutive failures than the check's retry budget.
  bool is_failing(const std::string& name) const;

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, HealthCheck> checks_;
  std::unordered_map<std::string, ServiceHealth> results_;
};

} // namespace devsup
