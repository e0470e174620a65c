#include <devsup/error.hpp>
#include <devsup/log_streamer.hpp>
#include <devsup/log_watcher.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <deque>
#include <fstream>

namespace fs = std::filesystem;

namespace devsup {

std::optional<LogFormat> parse_log_format(std::string_view v) {
  std::string s(v);
  for (auto& ch : s)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (s == "pretty") return LogFormat::Pretty;
  if (s == "json") return LogFormat::Json;
  if (s == "raw") return LogFormat::Raw;
  return std::nullopt;
}

bool matches(const LogEntry& e, const StreamConfig& cfg) {
  if (cfg.level_filter && e.level < *cfg.level_filter)
    return false;
  if (cfg.service_filter && e.service.find(*cfg.service_filter) == std::string::npos)
    return false;
  if (cfg.pattern_filter && !std::regex_search(e.message, *cfg.pattern_filter))
    return false;
  return true;
}

static fmt::color level_color(LogLevel l) {
  switch (l) {
  case LogLevel::Trace: return fmt::color::gray;
  case LogLevel::Debug: return fmt::color::cyan;
  case LogLevel::Info: return fmt::color::green;
  case LogLevel::Warn: return fmt::color::yellow;
  case LogLevel::Error: return fmt::color::red;
  }
  return fmt::color::white;
}

static std::string render_pretty(const LogEntry& e, bool color) {
  auto clock = format_local_clock(e.timestamp);
  auto level = fmt::format("{:<5}", to_string(e.level));
  std::string out;
  if (color) {
    out = fmt::format("{} {} {} {}\n",
                      fmt::styled(clock, fmt::emphasis::faint),
                      fmt::styled(level, fmt::fg(level_color(e.level))),
                      fmt::styled(e.service, fmt::fg(fmt::color::dim_gray)),
                      e.message);
  } else {
    out = fmt::format("{} {} {} {}\n", clock, level, e.service, e.message);
  }

  if (!e.fields.empty()) {
    std::string fields;
    for (auto &[k, v] : e.fields) {
      if (!fields.empty())
        fields += ' ';
      fields += fmt::format("{}={}", k, v.dump());
    }
    out += color ? fmt::format("  {}\n", fmt::styled(fields, fmt::emphasis::faint))
                 : fmt::format("  {}\n", fields);
  }
  return out;
}

std::string render(const LogEntry& e, const StreamConfig& cfg) {
  switch (cfg.format) {
  case LogFormat::Pretty: return render_pretty(e, cfg.color);
  case LogFormat::Json: return to_json(e).dump() + "\n";
  case LogFormat::Raw: return e.raw + "\n";
  }
  return e.raw + "\n";
}

void write_start_marker(const fs::path& file, const std::string& service) {
  std::ofstream o(file, std::ios::app);
  if (!o)
    throw IoError("failed to open log file: " + file.string());
  o << format_utc(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
    << " [INFO] Service '" << service << "' started\n";
  o.flush();
  if (!o)
    throw IoError("failed to write log file: " + file.string());
}

LogStreamer::~LogStreamer() { stop(); }

void LogStreamer::add_log_file(const std::string& service, const fs::path& path,
                               bool follow) {
  Task t;
  t.follow = follow;
  t.done = std::make_shared<std::atomic_bool>(false);
  auto done = t.done;
  t.thread = std::thread([this, service, path, follow, done] {
    try {
      LogWatcher w(path, service, channel_);
      w.watch(follow, stopping_);
      spdlog::debug("[svc={}] watcher finished after {} entries", service,
                    w.emitted());
    } catch (const std::exception& e) {
      spdlog::error("[svc={}] log watcher: {}", service, e.what());
    }
    done->store(true);
  });

  std::lock_guard<std::mutex> lk(m_);
  for (auto a = abandoned_.begin(); a != abandoned_.end();) {
    if (a->done->load()) {
      a->thread.join();
      a = abandoned_.erase(a);
    } else {
      ++a;
    }
  }
  auto it = watchers_.find(service);
  if (it != watchers_.end()) {
    if (it->second.done->load())
      it->second.thread.join();
    else
      abandoned_.push_back(std::move(it->second));
    watchers_.erase(it);
  }
  watchers_.emplace(service, std::move(t));
}

bool LogStreamer::one_shot_pending() const {
  std::lock_guard<std::mutex> lk(m_);
  for (auto &[name, t] : watchers_)
    if (!t.follow && !t.done->load())
      return true;
  for (auto& t : abandoned_)
    if (!t.follow && !t.done->load())
      return true;
  return false;
}

std::vector<LogEntry> LogStreamer::collect(const StreamConfig& cfg) {
  std::lock_guard<std::mutex> consumer(consumer_m_);
  std::deque<LogEntry> kept;
  const std::size_t limit = cfg.lines.value_or(0);

  while (true) {
    // sampled before the receive: once every one-shot watcher is done, an
    // empty receive means everything they sent has been consumed
    bool pending = one_shot_pending();
    auto e = channel_.recv_for(kRecvTimeout);
    if (!e) {
      if (pending && !stopping_.load())
        continue;
      break;
    }
    if (!matches(*e, cfg))
      continue;
    kept.push_back(std::move(*e));
    if (cfg.lines && kept.size() > limit)
      kept.pop_front();
  }
  return {std::make_move_iterator(kept.begin()),
          std::make_move_iterator(kept.end())};
}

std::size_t LogStreamer::stream(const StreamConfig& cfg, std::ostream& out,
                                const std::atomic_bool& cancel) {
  if (!cfg.follow) {
    auto entries = collect(cfg);
    for (auto& e : entries)
      out << render(e, cfg);
    out.flush();
    return entries.size();
  }

  std::lock_guard<std::mutex> consumer(consumer_m_);
  std::size_t printed = 0;
  while (!cancel.load() && !stopping_.load()) {
    auto e = channel_.recv_for(kRecvTimeout);
    if (!e) {
      if (channel_.closed())
        break;
      continue;
    }
    if (!matches(*e, cfg))
      continue;
    out << render(*e, cfg);
    out.flush();
    ++printed;
  }
  return printed;
}

std::size_t LogStreamer::stream(const StreamConfig& cfg, std::ostream& out) {
  std::atomic_bool never{false};
  return stream(cfg, out, never);
}

fs::path LogStreamer::create_log_file(const std::string& service,
                                      const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw IoError("cannot create log dir " + dir.string() + ": " + ec.message());
  auto path = dir / (service + ".log");
  write_start_marker(path, service);
  return path;
}

std::size_t LogStreamer::running_watchers() const {
  std::lock_guard<std::mutex> lk(m_);
  std::size_t n = 0;
  for (auto &[name, t] : watchers_)
    if (!t.done->load())
      ++n;
  return n;
}

std::size_t LogStreamer::replaced_watchers() const {
  std::lock_guard<std::mutex> lk(m_);
  return abandoned_.size();
}

void LogStreamer::stop() {
  stopping_ = true;
  std::vector<Task> tasks;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto &[name, t] : watchers_)
      tasks.push_back(std::move(t));
    watchers_.clear();
    for (auto& t : abandoned_)
      tasks.push_back(std::move(t));
    abandoned_.clear();
  }
  for (auto& t : tasks)
    if (t.thread.joinable())
      t.thread.join();
  channel_.close();
}

} // namespace devsup
