#include <catch2/catch_all.hpp>
#include <devsup/health.hpp>
#include <devsup/timefmt.hpp>
#include <devsup/types.hpp>

using namespace devsup;

TEST_CASE("restart policy names") {
  REQUIRE(parse_restart_policy("on-failure") == RestartPolicy::OnFailure);
  REQUIRE(parse_restart_policy("Always") == RestartPolicy::Always);
  REQUIRE(parse_restart_policy("unless-stopped") == RestartPolicy::UnlessStopped);
  REQUIRE(parse_restart_policy("no") == RestartPolicy::Never);
  REQUIRE_FALSE(parse_restart_policy("sometimes"));
  REQUIRE(to_string(RestartPolicy::OnFailure) == "on-failure");
}

TEST_CASE("log levels are ordered and parsed case-insensitively") {
  REQUIRE(LogLevel::Trace < LogLevel::Debug);
  REQUIRE(LogLevel::Info < LogLevel::Warn);
  REQUIRE(LogLevel::Warn < LogLevel::Error);
  REQUIRE(parse_log_level("WARNING") == LogLevel::Warn);
  REQUIRE(parse_log_level("warn") == LogLevel::Warn);
  REQUIRE(parse_log_level("Error") == LogLevel::Error);
  REQUIRE_FALSE(parse_log_level("fatal"));
  REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
}

TEST_CASE("state and health rendering") {
  REQUIRE(to_string(ProcessState::running()) == "running");
  REQUIRE(to_string(ProcessState::failed("boom")) == "failed: boom");
  REQUIRE(to_string(HealthStatus::unhealthy("x")) == "unhealthy: x");
  REQUIRE(ProcessState::failed("a") != ProcessState::failed("b"));
  REQUIRE(HealthStatus{} == HealthStatus::unknown());
}

TEST_CASE("http status classification") {
  REQUIRE(classify_http_status(200).is(HealthStatus::Kind::Healthy));
  REQUIRE(classify_http_status(204).is(HealthStatus::Kind::Healthy));
  REQUIRE(classify_http_status(503) == HealthStatus::unhealthy("server error: 503"));
  REQUIRE(classify_http_status(404) == HealthStatus::degraded("status: 404"));
  REQUIRE(classify_http_status(302).is(HealthStatus::Kind::Degraded));
}

TEST_CASE("timestamp parsing") {
  auto a = parse_rfc3339("2024-01-01T10:00:00Z");
  auto b = parse_rfc3339("2024-01-01T12:00:00+02:00");
  REQUIRE(a);
  REQUIRE(b);
  REQUIRE(*a == *b);
  REQUIRE(format_rfc3339(*a) == "2024-01-01T10:00:00.000Z");

  auto c = parse_rfc3339("2024-01-01T10:00:00.250Z");
  REQUIRE(c);
  REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(*c - *a).count() == 250);

  REQUIRE_FALSE(parse_rfc3339("2024-01-01T10:00:00"));
  REQUIRE_FALSE(parse_rfc3339("yesterday"));

  auto d = parse_datetime("2024-01-01 10:00:00");
  REQUIRE(d);
  REQUIRE(*d == *a);
  REQUIRE_FALSE(parse_datetime("2024-13-01 10:00:00"));
}
