#pragma once
#include "channel.hpp"
#include "log_parser.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace devsup {

enum class LogFormat { Pretty, Json, Raw };

struct StreamConfig {
  bool follow = false;
  std::optional<std::size_t> lines = 100; // tail size, non-follow only
  std::optional<LogLevel> level_filter;   // minimum level
  std::optional<std::string> service_filter; // substring
  std::optional<std::regex> pattern_filter;  // searched in the message
  LogFormat format = LogFormat::Pretty;
  bool color = false;
};

std::optional<LogFormat> parse_log_format(std::string_view v);

// All configured filters must pass.
bool matches(const LogEntry& e, const StreamConfig& cfg);
// Rendered entry, newline-terminated. Pretty may add a second line of fields.
std::string render(const LogEntry& e, const StreamConfig& cfg);

// Appends the "service started" marker line, creating the file if needed.
// Throws IoError.
void write_start_marker(const std::filesystem::path& file,
                        const std::string& service);

// Fan-in of every watched log file onto one channel, with a single consumer.
class LogStreamer {
public:
  static constexpr std::chrono::milliseconds kRecvTimeout{100};

  LogStreamer() = default;
  ~LogStreamer();
  LogStreamer(const LogStreamer &) = delete;
  LogStreamer& operator=(const LogStreamer &) = delete;

  // One watcher thread per call. A second call for the same service replaces
  // the tracked task; a replaced task still running is joined once it has
  // finished, on a later call or in stop().
  void add_log_file(const std::string& service,
                    const std::filesystem::path& path, bool follow);

  // Non-follow: drains until quiet and returns the last `lines` matches in
  // arrival order.
  std::vector<LogEntry> collect(const StreamConfig& cfg);

  // Non-follow prints collect(). Follow prints matches as they arrive until
  // `cancel` is set or the streamer stops. Returns the number printed.
  std::size_t stream(const StreamConfig& cfg, std::ostream& out,
                     const std::atomic_bool& cancel);
  std::size_t stream(const StreamConfig& cfg, std::ostream& out);

  // `dir/<service>.log`, opened for append with a start marker written.
  std::filesystem::path create_log_file(const std::string& service,
                                        const std::filesystem::path& dir);

  // Producers may feed entries directly as well.
  Channel<LogEntry>& channel() { return channel_; }

  std::size_t running_watchers() const;
  // Replaced watcher threads not yet joined.
  std::size_t replaced_watchers() const;

  // Stops follow watchers and joins every watcher thread.
  void stop();

private:
  struct Task {
    std::thread thread;
    std::shared_ptr<std::atomic_bool> done;
    bool follow = false;
  };

  bool one_shot_pending() const;

  mutable std::mutex m_;
  std::unordered_map<std::string, Task> watchers_;
  std::vector<Task> abandoned_;
  std::atomic_bool stopping_{false};

  std::mutex consumer_m_;
  Channel<LogEntry> channel_;
};

} // namespace devsup
