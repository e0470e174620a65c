#include <devsup/error.hpp>
#include <devsup/unit.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace devsup {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

std::vector<std::string> split_command(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  bool in_single = false, in_double = false, esc = false, have = false;
  for (char c : s) {
    if (esc) {
      cur.push_back(c);
      esc = false;
      continue;
    }
    if (c == '\\') {
      esc = true;
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = !in_single;
      have = true;
      continue;
    }
    if (c == '"' && !in_single) {
      in_double = !in_double;
      have = true;
      continue;
    }
    if (!in_single && !in_double && (c == ' ' || c == '\t')) {
      if (have || !cur.empty()) {
        out.push_back(cur);
        cur.clear();
        have = false;
      }
      continue;
    }
    cur.push_back(c);
  }
  if (have || !cur.empty())
    out.push_back(cur);
  return out;
}

static void parse_env_list(ServiceConfig& c, const std::string& val) {
  std::stringstream ss(val);
  std::string kv;
  while (std::getline(ss, kv, ';')) {
    auto pos = kv.find('=');
    if (pos == std::string::npos)
      continue;
    auto k = trim(kv.substr(0, pos));
    auto v = trim(kv.substr(pos + 1));
    if (!k.empty())
      c.env[k] = v;
  }
}

static void load_env_file(ServiceConfig& c, const fs::path& file) {
  std::ifstream in(file);
  if (!in) {
    spdlog::warn("[svc={}] EnvironmentFile not found: {}", c.name,
                 file.string());
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    auto s = trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';')
      continue;
    auto pos = s.find('=');
    if (pos == std::string::npos)
      continue;
    auto k = trim(s.substr(0, pos));
    auto v = trim(s.substr(pos + 1));
    if (!k.empty())
      c.env[k] = v;
  }
}

static int to_int(const std::string& key, const std::string& val) {
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    throw ConfigError(key + ": not a number: '" + val + "'");
  }
}

void ServiceConfig::validate() const {
  if (name.empty())
    throw ConfigError("service name is empty");
  if (command.empty())
    throw ConfigError("[svc=" + name + "] command is empty");
  if (health_check_interval.count() <= 0)
    throw ConfigError("[svc=" + name + "] health interval must be positive");
}

ServiceConfig ServiceConfig::Load(const fs::path& p) {
  auto path = fs::absolute(p);
  std::ifstream in(path);
  if (!in)
    throw ConfigError("unit file not found: " + p.string());

  ServiceConfig c;
  c.name = path.stem().string();
  std::vector<fs::path> env_files;

  bool in_service = false;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';')
      continue;
    if (line.front() == '[' && line.back() == ']') {
      in_service = (line == "[Service]");
      continue;
    }
    if (!in_service)
      continue;

    auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    auto key = trim(line.substr(0, eq));
    auto val = trim(line.substr(eq + 1));

    if (key == "ExecStart") {
      auto argv = split_command(val);
      if (!argv.empty()) {
        c.command = argv.front();
        c.args.assign(argv.begin() + 1, argv.end());
      }

    } else if (key == "WorkingDirectory") {
      if (!val.empty())
        c.working_dir = fs::path(val);

    } else if (key == "Environment") {
      parse_env_list(c, val);

    } else if (key == "EnvironmentFile") {
      std::stringstream ss(val);
      std::string one;
      while (std::getline(ss, one, ';')) {
        one = trim(one);
        if (one.empty())
          continue;
        fs::path ef = one;
        if (!ef.is_absolute())
          ef = path.parent_path() / ef;
        env_files.push_back(ef);
      }

    } else if (key == "HealthHttpUrl") {
      if (!val.empty())
        c.health_check_url = val;

    } else if (key == "ExecHealth") {
      c.health_command = split_command(val);

    } else if (key == "HealthIntervalSec") {
      c.health_check_interval = std::chrono::seconds(to_int(key, val));

    } else if (key == "HealthTimeoutMs") {
      c.health_check_timeout = std::chrono::milliseconds(to_int(key, val));

    } else if (key == "StartupTimeoutSec") {
      c.startup_timeout = std::chrono::seconds(to_int(key, val));

    } else if (key == "Restart") {
      if (auto rp = parse_restart_policy(val)) {
        c.restart_policy = *rp;
      } else {
        spdlog::warn("Unknown Restart policy '{}', falling back to 'never'",
                     val);
      }

    } else if (key == "RestartSec") {
      c.restart_delay = std::chrono::seconds(to_int(key, val));

    } else if (key == "RestartWindowSec") {
      c.restart_window = std::chrono::seconds(to_int(key, val));

    } else if (key == "MaxRestartsInWindow") {
      c.max_restarts_in_window = to_int(key, val);

    } else if (key == "LogFile") {
      if (!val.empty()) {
        fs::path lf = val;
        if (!lf.is_absolute())
          lf = path.parent_path() / lf;
        c.log_file = lf;
      }

    } else if (key == "Ports") {
      std::stringstream ss(val);
      std::string one;
      while (std::getline(ss, one, ',')) {
        one = trim(one);
        if (!one.empty())
          c.ports.push_back(one);
      }
    }
  }

  if (c.command.empty())
    throw ConfigError("ExecStart is required: " + p.string());
  if (!c.working_dir.empty() && !fs::exists(c.working_dir))
    throw ConfigError("WorkingDirectory not found: " + c.working_dir.string());

  for (auto& ef : env_files)
    load_env_file(c, ef);

  return c;
}

std::vector<ServiceConfig> load_units(const fs::path& dir) {
  std::vector<ServiceConfig> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    throw ConfigError("services directory not found: " + dir.string());

  std::vector<fs::path> files;
  for (auto& e : fs::directory_iterator(dir, ec)) {
    if (e.is_regular_file() && e.path().extension() == ".service")
      files.push_back(e.path());
  }
  std::sort(files.begin(), files.end());

  for (auto& f : files) {
    try {
      out.push_back(ServiceConfig::Load(f));
    } catch (const ConfigError& e) {
      spdlog::error("skipping {}: {}", f.string(), e.what());
    }
  }
  return out;
}

} // namespace devsup
