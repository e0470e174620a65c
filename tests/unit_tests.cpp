#include <catch2/catch_all.hpp>
#include <devsup/error.hpp>
#include <devsup/unit.hpp>

#include <filesystem>
#include <fstream>

using namespace devsup;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("devsup_unit_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void write(const fs::path& p, const std::string& text) {
  std::ofstream o(p);
  o << text;
}

TEST_CASE("split_command honours quotes and escapes") {
  auto v = split_command(R"(/bin/sh -c "echo hi there" 'a b' c\ d)");
  REQUIRE(v.size() == 5);
  REQUIRE(v[0] == "/bin/sh");
  REQUIRE(v[1] == "-c");
  REQUIRE(v[2] == "echo hi there");
  REQUIRE(v[3] == "a b");
  REQUIRE(v[4] == "c d");
  REQUIRE(split_command("  ").empty());
}

TEST_CASE("unit file with every key") {
  auto dir = mkd("full");
  write(dir / "api.env", "# comment\nFROM_FILE=1\nPORT=9000\n");
  write(dir / "api.service",
        "[Unit]\n"
        "Description=ignored\n"
        "[Service]\n"
        "ExecStart=/bin/sleep 30\n"
        "WorkingDirectory=" + dir.string() + "\n"
        "Environment=A=1; B = two\n"
        "EnvironmentFile=api.env\n"
        "HealthHttpUrl=http://127.0.0.1:8080/health\n"
        "HealthIntervalSec=2\n"
        "HealthTimeoutMs=300\n"
        "StartupTimeoutSec=4\n"
        "Restart=on-failure\n"
        "RestartSec=3\n"
        "RestartWindowSec=20\n"
        "MaxRestartsInWindow=7\n"
        "LogFile=logs/api.log\n"
        "Ports=8080, 9000\n");

  auto c = ServiceConfig::Load(dir / "api.service");
  REQUIRE(c.name == "api");
  REQUIRE(c.command == "/bin/sleep");
  REQUIRE(c.args == std::vector<std::string>{"30"});
  REQUIRE(c.working_dir == dir);
  REQUIRE(c.env.at("A") == "1");
  REQUIRE(c.env.at("B") == "two");
  // EnvironmentFile is applied after Environment=
  REQUIRE(c.env.at("PORT") == "9000");
  REQUIRE(c.env.at("FROM_FILE") == "1");
  REQUIRE(c.health_check_url == std::string("http://127.0.0.1:8080/health"));
  REQUIRE(c.health_check_interval == 2000ms);
  REQUIRE(c.health_check_timeout == 300ms);
  REQUIRE(c.startup_timeout == 4000ms);
  REQUIRE(c.restart_policy == RestartPolicy::OnFailure);
  REQUIRE(c.restart_delay == 3000ms);
  REQUIRE(c.restart_window == 20s);
  REQUIRE(c.max_restarts_in_window == 7);
  REQUIRE(c.log_file);
  REQUIRE(*c.log_file == fs::absolute(dir) / "logs" / "api.log");
  REQUIRE(c.ports == std::vector<std::string>{"8080", "9000"});
  REQUIRE(c.has_health_check());
  REQUIRE_NOTHROW(c.validate());
}

TEST_CASE("defaults for a minimal unit") {
  auto dir = mkd("minimal");
  write(dir / "worker.service", "[Service]\nExecStart=/bin/true\n");
  auto c = ServiceConfig::Load(dir / "worker.service");
  REQUIRE(c.restart_policy == RestartPolicy::Never);
  REQUIRE(c.health_check_interval == 10000ms);
  REQUIRE(c.health_check_timeout == 5000ms);
  REQUIRE(c.startup_timeout == 0ms);
  REQUIRE(c.working_dir.empty());
  REQUIRE_FALSE(c.has_health_check());
  REQUIRE_FALSE(c.log_file);
}

TEST_CASE("broken units raise ConfigError") {
  auto dir = mkd("broken");
  write(dir / "noexec.service", "[Service]\nWorkingDirectory=/tmp\n");
  write(dir / "nodir.service",
        "[Service]\nExecStart=/bin/true\nWorkingDirectory=/definitely/not/here\n");
  write(dir / "badnum.service", "[Service]\nExecStart=/bin/true\nRestartSec=soon\n");

  REQUIRE_THROWS_AS(ServiceConfig::Load(dir / "noexec.service"), ConfigError);
  REQUIRE_THROWS_AS(ServiceConfig::Load(dir / "nodir.service"), ConfigError);
  REQUIRE_THROWS_AS(ServiceConfig::Load(dir / "badnum.service"), ConfigError);
  REQUIRE_THROWS_AS(ServiceConfig::Load(dir / "missing.service"), ConfigError);
}

TEST_CASE("validate rejects empty name or command") {
  ServiceConfig c;
  c.command = "/bin/true";
  REQUIRE_THROWS_AS(c.validate(), ConfigError);
  c.name = "x";
  REQUIRE_NOTHROW(c.validate());
  c.command.clear();
  REQUIRE_THROWS_AS(c.validate(), ConfigError);
}

TEST_CASE("load_units skips broken files and sorts by name") {
  auto dir = mkd("dir");
  write(dir / "b.service", "[Service]\nExecStart=/bin/true\n");
  write(dir / "a.service", "[Service]\nExecStart=/bin/true\n");
  write(dir / "c.service", "[Service]\n");
  write(dir / "notes.txt", "not a unit");

  auto units = load_units(dir);
  REQUIRE(units.size() == 2);
  REQUIRE(units[0].name == "a");
  REQUIRE(units[1].name == "b");

  REQUIRE_THROWS_AS(load_units(dir / "nope"), ConfigError);
}
