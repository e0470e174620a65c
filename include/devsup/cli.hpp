#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace devsup {

struct CmdUp {
  std::string services_dir;
  std::string logs_dir = "logs";
  bool follow_logs = false;
};
struct CmdRun {
  std::string unit_file;
  std::string logs_dir = "logs";
  bool follow_logs = false;
};
struct CmdHealth {
  std::string services_dir;
};
struct CmdLogs {
  std::string logs_dir;
  bool follow = false;
  std::optional<std::size_t> lines = 100;
  std::optional<std::string> level;
  std::optional<std::string> service;
  std::optional<std::string> grep;
  std::string format = "pretty";
};
struct CmdCheck {
  std::string unit_file;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdUp, CmdRun, CmdHealth, CmdLogs, CmdCheck,
                             CmdHelp, CmdVersion>;

// Accepted anywhere on the command line.
struct GlobalOptions {
  bool verbose = false;
  std::optional<std::string> log_file;
};

struct ParseResult {
  std::optional<Command> cmd;
  GlobalOptions global;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace devsup
