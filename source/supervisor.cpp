#include <devsup/error.hpp>
#include <devsup/log_streamer.hpp>
#include <devsup/probe.hpp>
#include <devsup/supervisor.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <system_error>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace devsup {

namespace {

bool restarts_on_exit(RestartPolicy p, int code) {
  switch (p) {
  case RestartPolicy::Always:
  case RestartPolicy::UnlessStopped: return true;
  case RestartPolicy::OnFailure: return code != 0;
  case RestartPolicy::Never: return false;
  }
  return false;
}

bool restarts_on_unhealthy(RestartPolicy p) {
  return p == RestartPolicy::OnFailure || p == RestartPolicy::Always;
}

HealthStatus probe(const ServiceConfig& c) {
  try {
    if (c.health_check_url) {
      int code = http_get_status(*c.health_check_url, c.health_check_timeout);
      if (code >= 200 && code < 300)
        return HealthStatus::healthy();
      return HealthStatus::unhealthy(fmt::format("status: {}", code));
    }
    int rc = run_probe_command(c.health_command, c.working_dir,
                               c.health_check_timeout);
    if (rc == 0)
      return HealthStatus::healthy();
    return HealthStatus::unhealthy(fmt::format("health command exited with {}", rc));
  } catch (const HealthCheckError& e) {
    return HealthStatus::unhealthy(e.what());
  }
}

} // namespace

// ------------------------ lifecycle ------------------------

Supervisor::Supervisor(SupervisorOptions opts) : opts_(opts) {
  monitor_thread_ = std::thread([this] { monitor_exit_loop(); });
}

Supervisor::~Supervisor() {
  shutting_down_ = true;
  shutdown_.cancel();
  stop_all();
  if (monitor_thread_.joinable())
    monitor_thread_.join();
  join_tasks();
  // a start() that raced past the shutdown check may have left a child behind
  stop_all();
}

void Supervisor::attach_log_streamer(LogStreamer *streamer) {
  std::lock_guard<std::mutex> lk(m_);
  streamer_ = streamer;
}

void Supervisor::launch_task(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(tasks_m_);
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
  auto done = std::make_shared<std::atomic_bool>(false);
  tasks_.push_back({std::thread([fn = std::move(fn), done] {
                      fn();
                      done->store(true);
                    }),
                    done});
}

void Supervisor::join_tasks() {
  // tasks may launch further tasks while we join
  while (true) {
    std::vector<Task> tasks;
    {
      std::lock_guard<std::mutex> lk(tasks_m_);
      tasks.swap(tasks_);
    }
    if (tasks.empty())
      break;
    for (auto& t : tasks)
      if (t.thread.joinable())
        t.thread.join();
  }
}

// ------------------------ start / stop / restart ------------------------

void Supervisor::start(const ServiceConfig& config) {
  config.validate();
  if (shutting_down_)
    throw Error("supervisor is shutting down");

  const auto& name = config.name;
  std::uint64_t gen = 0;
  LogStreamer *streamer = nullptr;
  bool attach_watcher = false;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it != services_.end() && (it->second.state.is(ProcessState::Kind::Running) ||
                                  it->second.state.is(ProcessState::Kind::Starting))) {
      spdlog::info("[svc={}] already running (pid={})", name, it->second.pid);
      return;
    }
    auto& rec = services_[name];
    rec.config = config;
    rec.state = ProcessState::starting();
    rec.health = HealthStatus::unknown();
    rec.pid = -1;
    gen = ++rec.generation;

    streamer = streamer_;
    if (streamer && config.log_file)
      attach_watcher = watched_logs_.insert(name).second;
  }

  auto fail = [&](const std::string& why) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it != services_.end() && it->second.generation == gen)
      it->second.state = ProcessState::failed(why);
  };

  std::unique_ptr<ChildProcess> child;
  try {
    if (config.log_file) {
      std::error_code ec;
      if (config.log_file->has_parent_path())
        fs::create_directories(config.log_file->parent_path(), ec);
      write_start_marker(*config.log_file, name);
      // watcher first, so the follow-mode seek lands before the child's output
      if (attach_watcher)
        streamer->add_log_file(name, *config.log_file, true);
    }
    child = ChildProcess::spawn(config);
  } catch (const SpawnError& e) {
    spdlog::error("[svc={}] {}", name, e.what());
    fail(e.what());
    throw;
  } catch (const IoError& e) {
    spdlog::error("[svc={}] {}", name, e.what());
    fail(e.what());
    throw;
  }

  std::shared_ptr<Cancellation> cancel;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end() || it->second.generation != gen) {
      // stopped while we were spawning
      spdlog::info("[svc={}] stop requested during start; killing pid {}", name,
                   child->pid());
    } else {
      auto& rec = it->second;
      rec.pid = child->pid();
      rec.child = std::move(child);
      rec.state = ProcessState::running();
      rec.started_at = std::chrono::system_clock::now();
      rec.started_steady = std::chrono::steady_clock::now();
      rec.last_exit_code.reset();
      spdlog::info("[svc={}] started pid={} cmd={}", name, rec.pid, config.command);
      if (config.has_health_check()) {
        cancel = std::make_shared<Cancellation>();
        rec.poll_cancel = cancel;
      }
    }
  }
  if (child) {
    child->kill();
    return;
  }
  if (cancel)
    launch_task([this, name, gen, cancel] { health_loop(name, gen, cancel); });
}

void Supervisor::stop(const std::string& name, bool force) {
  std::unique_ptr<ChildProcess> child;
  std::shared_ptr<Cancellation> cancel;
  std::uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end()) {
      spdlog::debug("[svc={}] stop: not managed", name);
      return;
    }
    auto& rec = it->second;
    if (rec.state.is(ProcessState::Kind::Stopped))
      return;
    rec.state = ProcessState::stopping();
    gen = ++rec.generation;
    child = std::move(rec.child);
    cancel = std::move(rec.poll_cancel);
    rec.pid = -1;
  }
  if (cancel)
    cancel->cancel();

  std::optional<int> code;
  if (child) {
    if (force) {
      spdlog::info("[svc={}] killing pid {}", name, child->pid());
      child->kill();
    } else {
      spdlog::info("[svc={}] stopping pid {} (SIGTERM)", name, child->pid());
      try {
        child->signal(SIGTERM);
        if (!child->wait_for(opts_.grace_period)) {
          spdlog::warn("[svc={}] still alive after {}ms; SIGKILL", name,
                       opts_.grace_period.count());
          child->kill();
        }
      } catch (const SignalError& e) {
        spdlog::warn("[svc={}] {}; SIGKILL", name, e.what());
        child->kill();
      }
    }
    code = child->exit_code();
    child.reset();
  }

  std::lock_guard<std::mutex> lk(m_);
  auto it = services_.find(name);
  if (it == services_.end() || it->second.generation != gen)
    return; // started again meanwhile
  it->second.state = ProcessState::stopped();
  if (code)
    it->second.last_exit_code = code;
  spdlog::info("[svc={}] stopped", name);
}

void Supervisor::restart(const std::string& name) { do_restart(name); }

void Supervisor::do_restart(const std::string& name) {
  ServiceConfig config;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end())
      throw NotFound(name);
    it->second.state = ProcessState::restarting();
    config = it->second.config;
  }
  spdlog::info("[svc={}] restarting", name);

  stop(name, false);
  std::uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end() || !it->second.state.is(ProcessState::Kind::Stopped)) {
      spdlog::info("[svc={}] restart superseded", name);
      return;
    }
    it->second.state = ProcessState::restarting();
    gen = it->second.generation;
  }
  if (shutdown_.wait_for(opts_.settle_delay))
    throw Error("supervisor is shutting down");

  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    // a stop or start during the settle delay wins
    if (it == services_.end() || it->second.generation != gen ||
        !it->second.state.is(ProcessState::Kind::Restarting)) {
      spdlog::info("[svc={}] restart cancelled", name);
      return;
    }
    ++it->second.restart_count;
  }
  start(config);
}

// ------------------------ status ------------------------

ServiceStatus Supervisor::snapshot(const std::string& name,
                                   const ServiceProcess& rec) {
  ServiceStatus s;
  s.name = name;
  s.state = rec.state;
  s.health = rec.health;
  s.restart_count = rec.restart_count;
  s.pid = rec.pid;
  s.last_exit_code = rec.last_exit_code;
  s.started_at = rec.started_at;
  s.last_health_check = rec.last_health_check;
  return s;
}

std::optional<ServiceStatus> Supervisor::status(const std::string& name) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = services_.find(name);
  if (it == services_.end())
    return std::nullopt;
  return snapshot(it->first, it->second);
}

std::vector<ServiceStatus> Supervisor::list() const {
  std::vector<ServiceStatus> out;
  {
    std::lock_guard<std::mutex> lk(m_);
    out.reserve(services_.size());
    for (auto &[name, rec] : services_)
      out.push_back(snapshot(name, rec));
  }
  std::sort(out.begin(), out.end(),
            [](const ServiceStatus& a, const ServiceStatus& b) { return a.name < b.name; });
  return out;
}

void Supervisor::stop_all() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto &[name, rec] : services_)
      names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  for (auto& n : names)
    stop(n, false);
}

// ------------------------ background loops ------------------------

void Supervisor::health_loop(std::string name, std::uint64_t generation,
                             std::shared_ptr<Cancellation> cancel) {
  auto current = [&](ServiceConfig *out) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end() || it->second.generation != generation ||
        !it->second.state.is(ProcessState::Kind::Running))
      return false;
    if (out)
      *out = it->second.config;
    return true;
  };

  ServiceConfig config;
  if (!current(&config))
    return;

  while (true) {
    if (cancel->wait_for(config.health_check_interval))
      return;
    if (!current(nullptr))
      return;

    auto h = probe(config);

    bool trigger = false;
    {
      std::lock_guard<std::mutex> lk(m_);
      auto it = services_.find(name);
      if (it == services_.end() || it->second.generation != generation ||
          !it->second.state.is(ProcessState::Kind::Running))
        return;
      auto& rec = it->second;
      if (rec.health != h)
        spdlog::info("[svc={}] health: {}", name, to_string(h));
      rec.health = h;
      rec.last_health_check = std::chrono::system_clock::now();

      if (h.is(HealthStatus::Kind::Unhealthy) &&
          restarts_on_unhealthy(rec.config.restart_policy)) {
        auto up = std::chrono::steady_clock::now() - rec.started_steady;
        if (up >= rec.config.startup_timeout) {
          rec.state = ProcessState::restarting();
          trigger = true;
        } else {
          spdlog::debug("[svc={}] unhealthy inside startup window", name);
        }
      }
    }

    if (trigger) {
      spdlog::warn("[svc={}] health-check failed; restarting", name);
      try {
        do_restart(name);
      } catch (const Error& e) {
        spdlog::error("[svc={}] restart failed: {}", name, e.what());
      }
      return;
    }
  }
}

void Supervisor::monitor_exit_loop() {
  using clock = std::chrono::steady_clock;

  while (!shutdown_.wait_for(opts_.exit_poll_interval)) {
    std::vector<std::unique_ptr<ChildProcess>> reaped;
    std::vector<std::string> to_restart;
    {
      std::lock_guard<std::mutex> lk(m_);
      for (auto &[name, rec] : services_) {
        if (!rec.state.is(ProcessState::Kind::Running) || !rec.child)
          continue;
        auto code = rec.child->try_wait();
        if (!code)
          continue;

        spdlog::warn("[svc={}] exited with status {}", name, *code);
        rec.last_exit_code = code;
        rec.pid = -1;
        reaped.push_back(std::move(rec.child));
        if (rec.poll_cancel) {
          rec.poll_cancel->cancel();
          rec.poll_cancel.reset();
        }
        ++rec.generation;

        if (!restarts_on_exit(rec.config.restart_policy, *code)) {
          rec.state = ProcessState::failed(fmt::format("exited with status {}", *code));
          continue;
        }

        auto now = clock::now();
        while (!rec.auto_restarts.empty() &&
               now - rec.auto_restarts.front() > rec.config.restart_window)
          rec.auto_restarts.pop_front();
        if (static_cast<int>(rec.auto_restarts.size()) >= rec.config.max_restarts_in_window) {
          spdlog::error("[svc={}] too many restarts in {}s; giving up", name,
                        rec.config.restart_window.count());
          rec.state = ProcessState::failed("restart limit reached");
          continue;
        }
        rec.auto_restarts.push_back(now);
        rec.state = ProcessState::restarting();
        to_restart.push_back(name);
      }
    }
    reaped.clear(); // joins output pumps outside the lock

    for (auto& n : to_restart)
      launch_task([this, n] { auto_restart(n); });
  }
}

void Supervisor::auto_restart(const std::string& name) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    if (it == services_.end())
      return;
    delay = it->second.config.restart_delay;
  }
  if (shutdown_.wait_for(delay))
    return;

  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = services_.find(name);
    // stopped by the user during the delay
    if (it == services_.end() || !it->second.state.is(ProcessState::Kind::Restarting))
      return;
  }
  try {
    do_restart(name);
  } catch (const Error& e) {
    spdlog::error("[svc={}] restart failed: {}", name, e.what());
  }
}

} // namespace devsup
