#pragma once
#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devsup {

struct ServiceConfig {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  std::unordered_map<std::string, std::string> env;

  std::optional<std::string> health_check_url;
  std::vector<std::string> health_command; // argv, used when no URL is set
  std::chrono::milliseconds health_check_interval{10000};
  std::chrono::milliseconds health_check_timeout{5000};
  // Unhealthy results inside this window after start do not trigger
  // restarts. Zero means the first unhealthy result may restart.
  std::chrono::milliseconds startup_timeout{0};

  RestartPolicy restart_policy = RestartPolicy::Never;
  std::chrono::milliseconds restart_delay{1000};
  std::chrono::seconds restart_window{10};
  int max_restarts_in_window = 5;

  std::optional<std::filesystem::path> log_file;
  std::vector<std::string> ports; // informational

  bool has_health_check() const {
    return health_check_url.has_value() || !health_command.empty();
  }

  // Throws ConfigError on an empty name or command.
  void validate() const;

  // Reads a `<name>.service` unit file ([Service] section).
  static ServiceConfig Load(const std::filesystem::path& p);
};

std::vector<std::string> split_command(const std::string& s);

// Every *.service in `dir`, sorted by name. Broken units are logged and
// skipped.
std::vector<ServiceConfig> load_units(const std::filesystem::path& dir);

} // namespace devsup
