#include <devsup/app.hpp>
#include <devsup/cli.hpp>
#include <devsup/error.hpp>
#include <devsup/health.hpp>
#include <devsup/log_streamer.hpp>
#include <devsup/supervisor.hpp>
#include <devsup/unit.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#ifndef DEVSUP_COMMIT
#define DEVSUP_COMMIT "unknown"
#endif
#ifndef DEVSUP_BUILD_TIME
#define DEVSUP_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace devsup {

static std::atomic_bool g_stop{false};

static void on_signal(int sig) {
  if (sig == SIGINT || sig == SIGTERM)
    g_stop.store(true);
}

static void print_help() {
  std::cout <<
      R"(devsup - local dev environment supervisor

Usage:
  devsup up <services_dir> [--logs-dir DIR] [--follow-logs]
  devsup run <unit_file> [--logs-dir DIR] [--follow-logs]
  devsup health <services_dir>
  devsup logs <logs_dir> [--follow] [--lines N] [--level L] [--service S]
                         [--grep RE] [--format pretty|json|raw]
  devsup check <unit_file>
  devsup help | version

Global options:
  -v, --verbose        debug logging
  --log-file PATH      log to a rotating file instead of stderr

Environment:
  DEVSUP_GRACE_SEC     SIGTERM grace period before SIGKILL (default 5)
)";
}

static void setup_logging(const GlobalOptions& g) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (g.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          *g.log_file, 5 * 1024 * 1024, 3);
      auto logger = std::make_shared<spdlog::logger>("devsup", sink);
      spdlog::set_default_logger(logger);
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::warn("failed to open log file {}: {}; logging to stderr",
                   *g.log_file, e.what());
    }
  }
  if (g.verbose)
    spdlog::set_level(spdlog::level::debug);
}

static SupervisorOptions supervisor_options() {
  SupervisorOptions o;
  if (const char *v = std::getenv("DEVSUP_GRACE_SEC")) {
    char *end = nullptr;
    long sec = std::strtol(v, &end, 10);
    if (*v != '\0' && *end == '\0' && sec >= 0)
      o.grace_period = std::chrono::seconds(sec);
    else
      spdlog::warn("ignoring DEVSUP_GRACE_SEC={}", v);
  }
  return o;
}

static void print_status_table(const Supervisor& sup) {
  std::cout << fmt::format("{:<20} {:<28} {:<10} {:>8} {:>9}\n", "SERVICE",
                           "STATE", "HEALTH", "PID", "RESTARTS");
  for (auto& s : sup.list()) {
    std::cout << fmt::format("{:<20} {:<28} {:<10} {:>8} {:>9}\n", s.name,
                             to_string(s.state), to_string(s.health),
                             s.pid > 0 ? std::to_string(s.pid) : "-",
                             s.restart_count);
  }
  std::cout.flush();
}

// Starts every unit and supervises until SIGINT/SIGTERM.
static int supervise(std::vector<ServiceConfig> units, const fs::path& logs_dir,
                     bool follow_logs) {
  if (units.empty()) {
    spdlog::error("no services to start");
    return 1;
  }

  // streamer outlives the supervisor that feeds it
  LogStreamer streamer;
  Supervisor sup(supervisor_options());
  if (follow_logs)
    sup.attach_log_streamer(&streamer);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::size_t started = 0;
  for (auto& u : units) {
    if (!u.log_file)
      u.log_file = logs_dir / (u.name + ".log");
    try {
      sup.start(u);
      ++started;
    } catch (const Error& e) {
      spdlog::error("[svc={}] start failed: {}", u.name, e.what());
    }
  }
  print_status_table(sup);
  if (started == 0) {
    sup.stop_all();
    return 1;
  }

  std::thread printer;
  if (follow_logs) {
    printer = std::thread([&] {
      StreamConfig cfg;
      cfg.follow = true;
      cfg.color = ::isatty(STDOUT_FILENO) != 0;
      streamer.stream(cfg, std::cout, g_stop);
    });
  }

  spdlog::info("supervising {} service(s); Ctrl-C to stop", started);
  while (!g_stop.load())
    std::this_thread::sleep_for(200ms);

  spdlog::info("shutting down");
  sup.stop_all();
  streamer.stop();
  if (printer.joinable())
    printer.join();
  print_status_table(sup);
  return 0;
}

static int health_once(const fs::path& services_dir) {
  HealthMonitor monitor;
  std::size_t registered = 0;
  for (auto& u : load_units(services_dir)) {
    if (!u.health_check_url)
      continue;
    HealthCheck hc;
    hc.endpoint = *u.health_check_url;
    hc.interval = u.health_check_interval;
    hc.timeout = u.health_check_timeout;
    monitor.register_check(u.name, hc);
    ++registered;
  }
  if (registered == 0) {
    std::cout << "(no services with HealthHttpUrl)\n";
    return 0;
  }

  auto results = monitor.check_all();
  std::cout << fmt::format("{:<20} {:<40} {:>8}\n", "SERVICE", "HEALTH", "LATENCY");
  for (auto &[name, status] : results) {
    std::string latency = "-";
    if (auto h = monitor.get(name); h && h->response_time)
      latency = fmt::format("{}ms", h->response_time->count());
    std::cout << fmt::format("{:<20} {:<40} {:>8}\n", name, to_string(status),
                             latency);
  }
  auto bad = monitor.unhealthy_services();
  return bad.empty() ? 0 : 1;
}

static int stream_logs(const CmdLogs& c) {
  StreamConfig cfg;
  cfg.follow = c.follow;
  cfg.lines = c.lines;
  if (c.level) {
    auto l = parse_log_level(*c.level);
    if (!l) {
      spdlog::error("logs: unknown level {}", *c.level);
      return 2;
    }
    cfg.level_filter = l;
  }
  cfg.service_filter = c.service;
  if (c.grep) {
    try {
      cfg.pattern_filter = std::regex(*c.grep);
    } catch (const std::regex_error& e) {
      spdlog::error("logs: bad --grep pattern: {}", e.what());
      return 2;
    }
  }
  auto fmt_kind = parse_log_format(c.format);
  if (!fmt_kind) {
    spdlog::error("logs: unknown format {}", c.format);
    return 2;
  }
  cfg.format = *fmt_kind;
  cfg.color = cfg.format == LogFormat::Pretty && ::isatty(STDOUT_FILENO) != 0;

  fs::path dir = c.logs_dir;
  if (!fs::is_directory(dir)) {
    spdlog::error("logs: not a directory: {}", dir.string());
    return 1;
  }
  std::vector<fs::path> files;
  for (auto& e : fs::directory_iterator(dir))
    if (e.is_regular_file() && e.path().extension() == ".log")
      files.push_back(e.path());
  std::sort(files.begin(), files.end());
  if (files.empty()) {
    std::cout << "(no *.log files in " << dir.string() << ")\n";
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  LogStreamer streamer;
  for (auto& f : files)
    streamer.add_log_file(f.stem().string(), f, c.follow);
  streamer.stream(cfg, std::cout, g_stop);
  streamer.stop();
  return 0;
}

static int check_unit(const fs::path& unit_file) {
  auto u = ServiceConfig::Load(unit_file);
  u.validate();

  std::string args;
  for (auto& a : u.args)
    args += (args.empty() ? "" : " ") + a;
  std::cout << fmt::format("name:              {}\n", u.name)
            << fmt::format("command:           {} {}\n", u.command, args)
            << fmt::format("working dir:       {}\n",
                           u.working_dir.empty() ? "(inherit)" : u.working_dir.string())
            << fmt::format("env overrides:     {}\n", u.env.size())
            << fmt::format("restart:           {} (delay {}ms, max {} in {}s)\n",
                           to_string(u.restart_policy), u.restart_delay.count(),
                           u.max_restarts_in_window, u.restart_window.count());
  if (u.health_check_url)
    std::cout << fmt::format("health url:        {} every {}ms\n",
                             *u.health_check_url, u.health_check_interval.count());
  else if (!u.health_command.empty())
    std::cout << fmt::format("health command:    {} every {}ms\n",
                             u.health_command.front(), u.health_check_interval.count());
  if (u.log_file)
    std::cout << fmt::format("log file:          {}\n", u.log_file->string());
  if (!u.ports.empty()) {
    std::string ports;
    for (auto& p : u.ports)
      ports += (ports.empty() ? "" : ",") + p;
    std::cout << fmt::format("ports:             {}\n", ports);
  }
  std::cout << "ok\n";
  return 0;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  setup_logging(pr.global);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto&& c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("devsup {} (built {})\n", DEVSUP_COMMIT,
                                     DEVSUP_BUILD_TIME);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdUp>) {
            return supervise(load_units(c.services_dir), c.logs_dir, c.follow_logs);

          } else if constexpr (std::is_same_v<T, CmdRun>) {
            std::vector<ServiceConfig> units{ServiceConfig::Load(c.unit_file)};
            return supervise(std::move(units), c.logs_dir, c.follow_logs);

          } else if constexpr (std::is_same_v<T, CmdHealth>) {
            return health_once(c.services_dir);

          } else if constexpr (std::is_same_v<T, CmdLogs>) {
            return stream_logs(c);

          } else if constexpr (std::is_same_v<T, CmdCheck>) {
            return check_unit(c.unit_file);
          }
        },
        *pr.cmd);
  } catch (const Error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace devsup
