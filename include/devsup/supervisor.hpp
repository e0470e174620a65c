#pragma once
#include "channel.hpp"
#include "child.hpp"
#include "types.hpp"
#include "unit.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace devsup {

class LogStreamer;

struct SupervisorOptions {
  std::chrono::milliseconds grace_period{5000};
  std::chrono::milliseconds settle_delay{1000};
  std::chrono::milliseconds exit_poll_interval{200};
};

struct ServiceStatus {
  std::string name;
  ProcessState state;
  HealthStatus health;
  std::uint32_t restart_count = 0;
  int pid = -1;
  std::optional<int> last_exit_code;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> last_health_check;
};

// Registry of named services and their child processes. Every public method
// is thread-safe; the registry lock is never held across a signal wait, a
// spawn or a health probe.
class Supervisor {
public:
  explicit Supervisor(SupervisorOptions opts = {});
  ~Supervisor();
  Supervisor(const Supervisor &) = delete;
  Supervisor& operator=(const Supervisor &) = delete;

  // Services with a log file get a follow-mode watcher on `streamer`, which
  // must outlive this supervisor.
  void attach_log_streamer(LogStreamer *streamer);

  // No-op when the service is already running. Throws ConfigError for a
  // malformed config, SpawnError/IoError when the child cannot be started
  // (the record is kept as Failed).
  void start(const ServiceConfig& config);

  // Never throws. Unknown or stopped services are left alone.
  void stop(const std::string& name, bool force = false);

  // Throws NotFound if `name` was never started; rethrows SpawnError if the
  // new child cannot be started.
  void restart(const std::string& name);

  std::optional<ServiceStatus> status(const std::string& name) const;
  std::vector<ServiceStatus> list() const;

  void stop_all();

private:
  struct ServiceProcess {
    ServiceConfig config;
    ProcessState state = ProcessState::starting();
    std::unique_ptr<ChildProcess> child;
    int pid = -1;
    std::optional<int> last_exit_code;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::chrono::steady_clock::time_point started_steady{};
    std::uint32_t restart_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_health_check;
    HealthStatus health;

    // bumped by every start and stop; background tasks holding an older
    // value exit
    std::uint64_t generation = 0;
    std::shared_ptr<Cancellation> poll_cancel;
    std::deque<std::chrono::steady_clock::time_point> auto_restarts;
  };

  struct Task {
    std::thread thread;
    std::shared_ptr<std::atomic_bool> done;
  };

  void do_restart(const std::string& name);
  void health_loop(std::string name, std::uint64_t generation,
                   std::shared_ptr<Cancellation> cancel);
  void monitor_exit_loop();
  void auto_restart(const std::string& name);
  void launch_task(std::function<void()> fn);
  void join_tasks();
  static ServiceStatus snapshot(const std::string& name,
                                const ServiceProcess& rec);

  SupervisorOptions opts_;

  mutable std::mutex m_;
  std::unordered_map<std::string, ServiceProcess> services_;
  LogStreamer *streamer_ = nullptr;
  std::unordered_set<std::string> watched_logs_;

  std::mutex tasks_m_;
  std::vector<Task> tasks_;

  std::atomic_bool shutting_down_{false};
  Cancellation shutdown_;
  std::thread monitor_thread_;
};

} // namespace devsup
