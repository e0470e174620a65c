#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace devsup {

struct HttpTarget {
  bool tls = false;
  std::string host;
  std::string port = "80";
  std::string path = "/";
};

// http:// and https:// URLs (default ports 80 and 443). Throws
// HealthCheckError for any other scheme or a missing host.
HttpTarget parse_http_url(const std::string& url);

// One GET request, over TLS for https:// (certificates are not verified). Returns the response status code; every transport failure
// (resolve, connect, timeout, garbage reply) throws HealthCheckError.
int http_get_status(const std::string& url, std::chrono::milliseconds timeout);

// Runs argv and returns its exit status. The process group is killed and
// HealthCheckError thrown when it outlives `timeout` or cannot be started.
int run_probe_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd,
                      std::chrono::milliseconds timeout);

} // namespace devsup
