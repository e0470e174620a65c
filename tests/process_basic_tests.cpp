#include <catch2/catch_all.hpp>
#include <devsup/child.hpp>
#include <devsup/error.hpp>
#include <devsup/probe.hpp>

#include <signal.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

using namespace devsup;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("devsup_proc_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

// Dead or a zombie waiting for whoever adopted it.
static bool process_gone(int pid) {
  if (::kill(pid, 0) != 0)
    return true;
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  std::string stat((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  auto rp = stat.rfind(')');
  return rp == std::string::npos || (rp + 2 < stat.size() && stat[rp + 2] == 'Z');
}

static ServiceConfig sh(const std::string& name, const std::string& script) {
  ServiceConfig c;
  c.name = name;
  c.command = "/bin/sh";
  c.args = {"-c", script};
  return c;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST_CASE("spawn, signal and reap a sleep") {
  ServiceConfig c;
  c.name = "sleeper";
  c.command = "/bin/sleep";
  c.args = {"30"};

  auto child = ChildProcess::spawn(c);
  REQUIRE(child->pid() > 0);
  REQUIRE_FALSE(child->try_wait());

  child->signal(SIGTERM);
  REQUIRE(child->wait_for(2s));
  REQUIRE(child->exited());
  REQUIRE(child->exit_code() == 128 + SIGTERM);
}

TEST_CASE("exit status is reported") {
  auto child = ChildProcess::spawn(sh("exit3", "exit 3"));
  REQUIRE(child->wait_for(2s));
  REQUIRE(child->exit_code() == 3);
}

TEST_CASE("missing executable is a SpawnError") {
  ServiceConfig c;
  c.name = "ghost";
  c.command = "/definitely/not/a/binary";
  try {
    ChildProcess::spawn(c);
    FAIL("spawn should throw");
  } catch (const SpawnError& e) {
    REQUIRE(e.code() == ENOENT);
    REQUIRE(std::string(e.what()).find("ghost") != std::string::npos);
  }
}

TEST_CASE("working dir and env overrides reach the child") {
  auto dir = mkd("env");
  auto c = sh("envcheck", "pwd; echo \"$GREETING\"; echo \"$PATH\" | grep -q / && echo inherited");
  c.working_dir = dir;
  c.env["GREETING"] = "hello";
  c.log_file = dir / "out" / "envcheck.log";

  auto child = ChildProcess::spawn(c);
  REQUIRE(child->wait_for(2s));
  REQUIRE(child->exit_code() == 0);

  auto text = slurp(*c.log_file);
  REQUIRE(text.find(fs::canonical(dir).string()) != std::string::npos);
  REQUIRE(text.find("hello") != std::string::npos);
  REQUIRE(text.find("inherited") != std::string::npos);
}

TEST_CASE("stdout and stderr both land in the log file") {
  auto dir = mkd("streams");
  auto c = sh("both", "echo out-line; echo err-line 1>&2");
  c.log_file = dir / "both.log";
  {
    auto child = ChildProcess::spawn(c);
    REQUIRE(child->wait_for(2s));
  }
  auto text = slurp(*c.log_file);
  REQUIRE(text.find("out-line") != std::string::npos);
  REQUIRE(text.find("err-line") != std::string::npos);
}

TEST_CASE("kill takes down the whole process group") {
  auto dir = mkd("group");
  auto pidfile = dir / "grandchild.pid";
  auto c = sh("tree", "sleep 30 & echo $! > " + pidfile.string() + "; wait");
  auto child = ChildProcess::spawn(c);

  for (int i = 0; i < 100 && !fs::exists(pidfile); ++i)
    std::this_thread::sleep_for(20ms);
  std::this_thread::sleep_for(50ms);
  int grandchild = std::stoi(slurp(pidfile));
  REQUIRE(grandchild > 0);

  child->kill();
  REQUIRE(child->exited());

  bool gone = false;
  for (int i = 0; i < 100 && !gone; ++i) {
    gone = process_gone(grandchild);
    if (!gone)
      std::this_thread::sleep_for(20ms);
  }
  REQUIRE(gone);
}

TEST_CASE("dropping a running handle kills the child") {
  int pid = 0;
  {
    ServiceConfig c;
    c.name = "dropped";
    c.command = "/bin/sleep";
    c.args = {"30"};
    auto child = ChildProcess::spawn(c);
    pid = child->pid();
  }
  REQUIRE(process_gone(pid));
}

TEST_CASE("probe command exit status and timeout") {
  REQUIRE(run_probe_command({"/bin/true"}, {}, 2s) == 0);
  REQUIRE(run_probe_command({"/bin/sh", "-c", "exit 4"}, {}, 2s) == 4);

  auto t0 = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(run_probe_command({"/bin/sleep", "5"}, {}, 200ms),
                    HealthCheckError);
  REQUIRE(std::chrono::steady_clock::now() - t0 < 3s);
}

TEST_CASE("health URL parsing") {
  auto t = parse_http_url("http://localhost:8080/health?x=1");
  REQUIRE(t.host == "localhost");
  REQUIRE(t.port == "8080");
  REQUIRE(t.path == "/health?x=1");

  auto d = parse_http_url("http://example.test");
  REQUIRE(d.port == "80");
  REQUIRE(d.path == "/");

  auto v6 = parse_http_url("http://[::1]:9000/");
  REQUIRE(v6.host == "::1");
  REQUIRE(v6.port == "9000");

  REQUIRE_FALSE(t.tls);
  auto s = parse_http_url("https://example.test/ready");
  REQUIRE(s.tls);
  REQUIRE(s.port == "443");
  REQUIRE(s.path == "/ready");
  REQUIRE(parse_http_url("https://[::1]:8443").port == "8443");

  REQUIRE_THROWS_AS(parse_http_url("ftp://example.test/"), HealthCheckError);
  REQUIRE_THROWS_AS(parse_http_url("http:///nohost"), HealthCheckError);
}
