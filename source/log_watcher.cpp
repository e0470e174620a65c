#include <devsup/error.hpp>
#include <devsup/log_watcher.hpp>

#include <spdlog/spdlog.h>

#include <sys/stat.h>

#include <thread>

namespace devsup {

void LogWatcher::open() {
  in_.close();
  in_.clear();
  in_.open(path_, std::ios::binary);
  if (!in_)
    throw IoError("failed to open log file: " + path_.string());
  struct stat st {};
  if (::stat(path_.c_str(), &st) == 0)
    inode_ = st.st_ino;
}

void LogWatcher::emit(const std::string& line) {
  std::string l = line;
  if (!l.empty() && l.back() == '\r')
    l.pop_back();
  if (auto e = parse_log_line(l, service_)) {
    sink_.send(std::move(*e));
    ++emitted_;
  }
}

void LogWatcher::drain() {
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(position_));
  if (!in_)
    return;

  char buf[4096];
  while (true) {
    in_.read(buf, sizeof(buf));
    auto got = in_.gcount();
    if (got <= 0)
      break;
    position_ += static_cast<std::uint64_t>(got);
    pending_.append(buf, static_cast<size_t>(got));

    size_t start = 0, nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
      emit(pending_.substr(start, nl - start));
      start = nl + 1;
    }
    pending_.erase(0, start);
  }
  in_.clear();
}

LogWatcher::Change LogWatcher::detect_change() const {
  struct stat st {};
  if (::stat(path_.c_str(), &st) != 0)
    return Change::None; // mid-rotation; keep the old handle for now
  if (st.st_ino != inode_)
    return Change::Rotated;
  if (static_cast<std::uint64_t>(st.st_size) < position_)
    return Change::Truncated;
  return Change::None;
}

void LogWatcher::watch(bool follow, const std::atomic_bool& stop_flag) {
  open();
  position_ = 0;
  pending_.clear();

  if (follow) {
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    position_ = end > 0 ? static_cast<std::uint64_t>(end) : 0;
  }

  while (true) {
    drain();

    if (!follow) {
      if (!pending_.empty()) {
        emit(pending_);
        pending_.clear();
      }
      break;
    }
    if (stop_flag.load())
      break;

    std::this_thread::sleep_for(kPollInterval);

    auto change = detect_change();
    if (change == Change::None)
      continue;
    if (change == Change::Rotated) {
      spdlog::info("[svc={}] log file rotated: {}", service_, path_.string());
      drain(); // tail of the renamed file
    } else {
      spdlog::info("[svc={}] log file truncated: {}", service_, path_.string());
    }
    open();
    position_ = 0;
    pending_.clear();
  }
}

void LogWatcher::watch(bool follow) {
  std::atomic_bool never{false};
  watch(follow, never);
}

} // namespace devsup
