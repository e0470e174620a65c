#include <catch2/catch_all.hpp>
#include <devsup/error.hpp>
#include <devsup/log_watcher.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace devsup;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("devsup_logrot_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void append(const fs::path& p, const std::string& text) {
  std::ofstream o(p, std::ios::app | std::ios::binary);
  o << text;
}

// Messages received until `n` arrived or `timeout` passed.
static std::vector<std::string> receive(Channel<LogEntry>& ch, std::size_t n,
                                        std::chrono::milliseconds timeout = 3000ms) {
  std::vector<std::string> out;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
    if (auto e = ch.recv_for(50ms))
      out.push_back(e->message);
  }
  return out;
}

// Runs a follow-mode watcher on its own thread for the lifetime of the object.
struct Follower {
  Follower(const fs::path& p, Channel<LogEntry>& ch) : w(p, "svc", ch) {
    th = std::thread([this] { w.watch(true, stop); });
    std::this_thread::sleep_for(150ms); // opened and seeked to the end
  }
  ~Follower() {
    stop = true;
    th.join();
  }
  LogWatcher w;
  std::atomic_bool stop{false};
  std::thread th;
};

TEST_CASE("one-shot read emits every line in order") {
  auto d = mkd("oneshot");
  auto f = d / "a.log";
  append(f, "first\r\nsecond\n\nthird-without-newline");

  Channel<LogEntry> ch;
  LogWatcher w(f, "a", ch);
  w.watch(false);

  REQUIRE(w.emitted() == 3);
  REQUIRE(w.position() == fs::file_size(f));
  auto got = receive(ch, 3);
  REQUIRE(got == std::vector<std::string>{"first", "second", "third-without-newline"});
}

TEST_CASE("missing file is an IoError") {
  Channel<LogEntry> ch;
  LogWatcher w(mkd("missing") / "nope.log", "x", ch);
  REQUIRE_THROWS_AS(w.watch(false), IoError);
}

TEST_CASE("follow mode skips existing content and holds partial lines") {
  auto d = mkd("follow");
  auto f = d / "b.log";
  append(f, "old line\n");

  Channel<LogEntry> ch;
  Follower fw(f, ch);

  append(f, "new one\nhalf");
  auto got = receive(ch, 1);
  REQUIRE(got == std::vector<std::string>{"new one"});
  REQUIRE(receive(ch, 1, 300ms).empty());

  append(f, " done\n");
  REQUIRE(receive(ch, 1) == std::vector<std::string>{"half done"});
}

TEST_CASE("truncated file is re-read from the start") {
  auto d = mkd("trunc");
  auto f = d / "c.log";
  append(f, "");

  Channel<LogEntry> ch;
  Follower fw(f, ch);

  append(f, "line-1 with some padding\nline-2 with some padding\nline-3 with some padding\n");
  REQUIRE(receive(ch, 3) == std::vector<std::string>{"line-1 with some padding",
                                                     "line-2 with some padding",
                                                     "line-3 with some padding"});

  {
    std::ofstream o(f, std::ios::trunc | std::ios::binary);
  }
  std::this_thread::sleep_for(300ms);
  append(f, "after-1\nafter-2\n");

  REQUIRE(receive(ch, 2) == std::vector<std::string>{"after-1", "after-2"});
  // nothing replayed from the old content
  REQUIRE(receive(ch, 1, 400ms).empty());
}

TEST_CASE("rotated file drains the old tail then follows the new file") {
  auto d = mkd("rotate");
  auto f = d / "d.log";
  append(f, "");

  Channel<LogEntry> ch;
  Follower fw(f, ch);

  append(f, "before\n");
  REQUIRE(receive(ch, 1) == std::vector<std::string>{"before"});

  // written and renamed between two polls
  append(f, "tail of old\n");
  fs::rename(f, d / "d.log.1");
  append(f, "fresh\n");

  auto got = receive(ch, 2);
  REQUIRE(got.size() == 2);
  REQUIRE(std::find(got.begin(), got.end(), "fresh") != got.end());
  REQUIRE(std::find(got.begin(), got.end(), "tail of old") != got.end());
}

TEST_CASE("watcher stops promptly when asked") {
  auto d = mkd("stop");
  auto f = d / "e.log";
  append(f, "x\n");

  Channel<LogEntry> ch;
  auto t0 = std::chrono::steady_clock::now();
  {
    Follower fw(f, ch);
  }
  REQUIRE(std::chrono::steady_clock::now() - t0 < 1s);
}
