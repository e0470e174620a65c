#include <devsup/error.hpp>
#include <devsup/health.hpp>
#include <devsup/probe.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace devsup {

HealthStatus classify_http_status(int code) {
  if (code >= 200 && code < 300)
    return HealthStatus::healthy();
  if (code >= 500)
    return HealthStatus::unhealthy(fmt::format("server error: {}", code));
  return HealthStatus::degraded(fmt::format("status: {}", code));
}

void HealthMonitor::register_check(const std::string& name, HealthCheck check) {
  std::lock_guard<std::mutex> lk(m_);
  checks_[name] = std::move(check);
  ServiceHealth h;
  h.name = name;
  results_[name] = std::move(h);
}

HealthStatus HealthMonitor::check_one(const std::string& name) {
  HealthCheck check;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = checks_.find(name);
    if (it == checks_.end())
      throw NotFound(name);
    check = it->second;
  }

  auto started = std::chrono::steady_clock::now();
  HealthStatus status;
  try {
    status = classify_http_status(http_get_status(check.endpoint, check.timeout));
  } catch (const HealthCheckError& e) {
    status = HealthStatus::unhealthy(fmt::format("connection error: {}", e.what()));
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!status.is(HealthStatus::Kind::Healthy))
    spdlog::warn("[svc={}] health {} -> {}", name, check.endpoint,
                 to_string(status));

  std::lock_guard<std::mutex> lk(m_);
  auto it = results_.find(name);
  if (it != results_.end()) {
    auto& h = it->second;
    h.status = status;
    h.last_check = std::chrono::system_clock::now();
    h.response_time = elapsed;
    if (status.is(HealthStatus::Kind::Healthy))
      h.consecutive_failures = 0;
    else
      h.consecutive_failures++;
  }
  return status;
}

std::map<std::string, HealthStatus> HealthMonitor::check_all() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& kv : checks_)
      names.push_back(kv.first);
  }

  std::map<std::string, HealthStatus> out;
  for (auto& n : names) {
    try {
      out[n] = check_one(n);
    } catch (const NotFound& e) {
      // unregistered concurrently
      spdlog::debug("check_all: {}", e.what());
    }
  }
  return out;
}

std::vector<std::string> HealthMonitor::unhealthy_services() const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<std::string> out;
  for (auto &[name, h] : results_) {
    if (!h.status.is(HealthStatus::Kind::Healthy) &&
        !h.status.is(HealthStatus::Kind::Unknown))
      out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<ServiceHealth> HealthMonitor::get(const std::string& name) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = results_.find(name);
  if (it == results_.end())
    return std::nullopt;
  return it->second;
}

bool HealthMonitor::is_healthy(const std::string& name) const {
  auto h = get(name);
  return h && h->status.is(HealthStatus::Kind::Healthy);
}

bool HealthMonitor::is_failing(const std::string& name) const {
  std::lock_guard<std::mutex> lk(m_);
  auto c = checks_.find(name);
  auto r = results_.find(name);
  if (c == checks_.end() || r == results_.end())
    return false;
  return r->second.consecutive_failures > c->second.retries;
}

} // namespace devsup
