#pragma once
#include "channel.hpp"
#include "log_parser.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace devsup {

// Tails one file and pushes parsed entries onto `sink`. Not thread-safe; one
// watcher per worker thread.
class LogWatcher {
public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  LogWatcher(std::filesystem::path path, std::string service,
             Channel<LogEntry>& sink)
      : path_(std::move(path)), service_(std::move(service)), sink_(sink) {}

  // One-shot mode reads from the start to EOF and returns. Follow mode starts
  // at the current end and polls until `stop_flag` is set. Throws IoError if
  // the file cannot be opened.
  void watch(bool follow, const std::atomic_bool& stop_flag);
  void watch(bool follow);

  std::uint64_t position() const { return position_; }
  std::size_t emitted() const { return emitted_; }

private:
  void open();
  void drain();
  void emit(const std::string& line);
  enum class Change { None, Truncated, Rotated };
  Change detect_change() const;

  std::filesystem::path path_;
  std::string service_;
  Channel<LogEntry>& sink_;

  std::ifstream in_;
  ino_t inode_ = 0;
  std::uint64_t position_ = 0;
  std::string pending_; // bytes after the last '\n'
  std::size_t emitted_ = 0;
};

} // namespace devsup
