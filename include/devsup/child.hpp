#pragma once
#include "unit.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace devsup {

// Owns one spawned child running in its own process group. Move-only through
// std::unique_ptr; the destructor kills and reaps a child that is still alive.
class ChildProcess {
public:
  // Throws SpawnError when fork/exec/chdir fails, IoError when the log file
  // cannot be opened.
  static std::unique_ptr<ChildProcess> spawn(const ServiceConfig& c);

  // Takes ownership of `pid`, which must lead its own process group.
  ChildProcess(std::string name, int pid) : name_(std::move(name)), pid_(pid) {}
  ~ChildProcess();
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess& operator=(const ChildProcess &) = delete;

  int pid() const { return pid_; }
  bool exited() const { return exited_; }
  std::optional<int> exit_code() const;

  // Sends `sig` to the whole process group. Throws SignalError; a group that
  // is already gone is not an error.
  void signal(int sig);

  // Non-blocking reap. Exit status, or 128+signo when killed by a signal.
  std::optional<int> try_wait();
  // True if the child was reaped before `timeout`.
  bool wait_for(std::chrono::milliseconds timeout);
  // SIGKILL to the group and a blocking reap.
  void kill();

private:
  void start_pump(int out_fd, int err_fd);
  void stop_pump();

  std::string name_;
  int pid_ = -1;
  bool exited_ = false;
  int exit_code_ = 0;

  std::atomic_bool pump_stop_{false};
  std::thread pump_;
};

} // namespace devsup
