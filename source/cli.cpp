#include <devsup/cli.hpp>

#include <cstdlib>
#include <string_view>
#include <vector>

namespace devsup {

static bool has_arg(std::size_t i, std::size_t n) { return i + 1 < n; }

static std::optional<std::size_t> parse_count(const std::string& s) {
  if (s.empty())
    return std::nullopt;
  char *end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (*end != '\0' || v < 0)
    return std::nullopt;
  return static_cast<std::size_t>(v);
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  // strip global options first
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "-v" || a == "--verbose") {
      r.global.verbose = true;
    } else if (a == "--log-file") {
      if (i + 1 >= argc) {
        r.error = "--log-file: path required";
        return r;
      }
      r.global.log_file = argv[++i];
    } else {
      args.emplace_back(a);
    }
  }

  if (args.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = args[0];
  const std::size_t n = args.size();
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "up" || cmd == "run") {
    if (n < 2) {
      r.error = cmd + (cmd == "up" ? ": services dir required" : ": unit file required");
      return r;
    }
    std::string logs_dir = "logs";
    bool follow = false;
    for (std::size_t i = 2; i < n; i++) {
      if (args[i] == "--logs-dir" && has_arg(i, n)) {
        logs_dir = args[++i];
      } else if (args[i] == "--follow-logs") {
        follow = true;
      } else {
        r.error = cmd + ": unknown option " + args[i];
        return r;
      }
    }
    if (cmd == "up")
      r.cmd = CmdUp{args[1], logs_dir, follow};
    else
      r.cmd = CmdRun{args[1], logs_dir, follow};
    return r;
  }

  if (cmd == "health") {
    if (n < 2) {
      r.error = "health: services dir required";
      return r;
    }
    r.cmd = CmdHealth{args[1]};
    return r;
  }

  if (cmd == "check") {
    if (n < 2) {
      r.error = "check: unit file required";
      return r;
    }
    r.cmd = CmdCheck{args[1]};
    return r;
  }

  if (cmd == "logs") {
    if (n < 2) {
      r.error = "logs: logs dir required";
      return r;
    }
    CmdLogs c{};
    c.logs_dir = args[1];
    for (std::size_t i = 2; i < n; i++) {
      const auto& a = args[i];
      if (a == "--follow" || a == "-f") {
        c.follow = true;
      } else if (a == "--lines" && has_arg(i, n)) {
        auto v = parse_count(args[++i]);
        if (!v) {
          r.error = "logs: bad --lines value " + args[i];
          return r;
        }
        c.lines = v;
      } else if (a == "--level" && has_arg(i, n)) {
        c.level = args[++i];
      } else if (a == "--service" && has_arg(i, n)) {
        c.service = args[++i];
      } else if (a == "--grep" && has_arg(i, n)) {
        c.grep = args[++i];
      } else if (a == "--format" && has_arg(i, n)) {
        c.format = args[++i];
      } else {
        r.error = "logs: unknown option " + a;
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace devsup
