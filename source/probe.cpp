#include <devsup/error.hpp>
#include <devsup/probe.hpp>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

using clock_type = std::chrono::steady_clock;

namespace devsup {

HttpTarget parse_http_url(const std::string& url) {
  HttpTarget t;
  std::string rest;
  if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else if (url.rfind("https://", 0) == 0) {
    rest = url.substr(8);
    t.tls = true;
    t.port = "443";
  } else {
    throw HealthCheckError("unsupported health URL scheme: " + url);
  }
  std::string host_port;
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    host_port = rest.substr(0, slash);
    t.path = rest.substr(slash);
  } else {
    host_port = rest;
  }
  t.host = host_port;
  auto colon = host_port.rfind(':');
  if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
    t.host = host_port.substr(0, colon);
    t.port = host_port.substr(colon + 1);
  } else if (host_port.size() > 2 && host_port.front() == '[') {
    auto close = host_port.find(']');
    t.host = host_port.substr(1, close - 1);
    if (close + 1 < host_port.size() && host_port[close + 1] == ':')
      t.port = host_port.substr(close + 2);
  }
  if (t.host.empty())
    throw HealthCheckError("health URL has no host: " + url);
  return t;
}

static int remaining_ms(clock_type::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - clock_type::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

namespace {
struct Socket {
  int fd = -1;
  ~Socket() {
    if (fd >= 0)
      ::close(fd);
  }
};

struct Tls {
  SSL_CTX *ctx = nullptr;
  SSL *ssl = nullptr;
  ~Tls() {
    if (ssl)
      SSL_free(ssl);
    if (ctx)
      SSL_CTX_free(ctx);
  }
};
} // namespace

static std::string tls_error() {
  unsigned long e = ERR_get_error();
  ERR_clear_error();
  if (e == 0)
    return "connection closed";
  char buf[256];
  ERR_error_string_n(e, buf, sizeof(buf));
  return buf;
}

static bool wait_fd(int fd, short events, clock_type::time_point deadline) {
  while (true) {
    pollfd p{fd, events, 0};
    int rc = ::poll(&p, 1, remaining_ms(deadline));
    if (rc > 0)
      return true;
    if (rc == 0)
      return false;
    if (errno != EINTR)
      return false;
  }
}

// Drives one non-blocking OpenSSL call to completion. Returns the call's
// result, or 0 on a clean close_notify.
template <class Op>
static int tls_io(SSL *ssl, int fd, clock_type::time_point deadline,
                  const std::string& what, const std::string& timeout_msg, Op op) {
  while (true) {
    ERR_clear_error();
    int rc = op();
    if (rc > 0)
      return rc;
    switch (SSL_get_error(ssl, rc)) {
    case SSL_ERROR_WANT_READ:
      if (!wait_fd(fd, POLLIN, deadline))
        throw HealthCheckError(timeout_msg);
      break;
    case SSL_ERROR_WANT_WRITE:
      if (!wait_fd(fd, POLLOUT, deadline))
        throw HealthCheckError(timeout_msg);
      break;
    case SSL_ERROR_ZERO_RETURN:
      return 0;
    default:
      throw HealthCheckError(fmt::format("{}: {}", what, tls_error()));
    }
  }
}

int http_get_status(const std::string& url, std::chrono::milliseconds timeout) {
  const auto t = parse_http_url(url);
  const auto deadline = clock_type::now() + timeout;

  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  addrinfo *res = nullptr;
  int gai = ::getaddrinfo(t.host.c_str(), t.port.c_str(), &hints, &res);
  if (gai != 0)
    throw HealthCheckError(
        fmt::format("resolve {}: {}", t.host, ::gai_strerror(gai)));

  Socket sock;
  std::string last_error = "no address";
  for (addrinfo *rp = res; rp; rp = rp->ai_next) {
    int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC,
                      rp->ai_protocol);
    if (fd < 0)
      continue;
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      if (wait_fd(fd, POLLOUT, deadline)) {
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
        rc = err == 0 ? 0 : -1;
        errno = err;
      } else {
        last_error = "connect timed out";
        rc = -1;
        errno = ETIMEDOUT;
      }
    }
    if (rc == 0) {
      sock.fd = fd;
      break;
    }
    last_error = fmt::format("connect: {}", std::strerror(errno));
    ::close(fd);
  }
  ::freeaddrinfo(res);
  if (sock.fd < 0)
    throw HealthCheckError(last_error);

  Tls tls;
  if (t.tls) {
    tls.ctx = SSL_CTX_new(TLS_client_method());
    if (!tls.ctx)
      throw HealthCheckError("TLS context: " + tls_error());
    // self-signed dev certificates are accepted
    SSL_CTX_set_verify(tls.ctx, SSL_VERIFY_NONE, nullptr);
    tls.ssl = SSL_new(tls.ctx);
    if (!tls.ssl)
      throw HealthCheckError("TLS session: " + tls_error());
    SSL_set_tlsext_host_name(tls.ssl, t.host.c_str());
    SSL_set_fd(tls.ssl, sock.fd);
    tls_io(tls.ssl, sock.fd, deadline, "TLS handshake", "TLS handshake timed out",
           [&] { return SSL_connect(tls.ssl); });
  }

  std::string req = "GET " + t.path + " HTTP/1.0\r\nHost: " + t.host +
                    "\r\nConnection: close\r\n\r\n";
  size_t sent = 0;
  while (sent < req.size()) {
    if (tls.ssl) {
      sent += static_cast<size_t>(
          tls_io(tls.ssl, sock.fd, deadline, "send", "send timed out", [&] {
            return SSL_write(tls.ssl, req.data() + sent,
                             static_cast<int>(req.size() - sent));
          }));
      continue;
    }
    if (!wait_fd(sock.fd, POLLOUT, deadline))
      throw HealthCheckError("send timed out");
    ssize_t n = ::send(sock.fd, req.data() + sent, req.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR)
        continue;
      throw HealthCheckError(fmt::format("send: {}", std::strerror(errno)));
    }
    sent += static_cast<size_t>(n);
  }

  const std::string read_timeout = fmt::format("timed out after {}ms", timeout.count());
  std::string head;
  char buf[512];
  while (head.find("\r\n") == std::string::npos && head.size() < 4096) {
    ssize_t n = 0;
    if (tls.ssl) {
      n = tls_io(tls.ssl, sock.fd, deadline, "recv", read_timeout, [&] {
        return SSL_read(tls.ssl, buf, static_cast<int>(sizeof(buf)));
      });
    } else {
      if (!wait_fd(sock.fd, POLLIN, deadline))
        throw HealthCheckError(read_timeout);
      n = ::recv(sock.fd, buf, sizeof(buf), 0);
      if (n < 0) {
        if (errno == EAGAIN || errno == EINTR)
          continue;
        throw HealthCheckError(fmt::format("recv: {}", std::strerror(errno)));
      }
    }
    if (n == 0)
      break;
    head.append(buf, static_cast<size_t>(n));
  }

  int code = 0;
  if (std::sscanf(head.c_str(), "HTTP/%*s %d", &code) != 1 || code <= 0)
    throw HealthCheckError("malformed HTTP response");
  return code;
}

int run_probe_command(const std::vector<std::string>& argv_s,
                      const std::filesystem::path& cwd,
                      std::chrono::milliseconds timeout) {
  if (argv_s.empty())
    throw HealthCheckError("empty health command");

  std::vector<char *> argv;
  argv.reserve(argv_s.size() + 1);
  for (auto& s : argv_s)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  const std::string dir = cwd.string();

  pid_t pid = ::fork();
  if (pid < 0)
    throw HealthCheckError(fmt::format("fork: {}", std::strerror(errno)));
  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      ::close(devnull);
    }
    if (!dir.empty() && ::chdir(dir.c_str()) != 0)
      _exit(127);
    ::execvp(argv[0], argv.data());
    _exit(127);
  }
  ::setpgid(pid, pid);

  const auto deadline = clock_type::now() + timeout;
  int st = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &st, WNOHANG);
    if (r == pid)
      break;
    if (r < 0 && errno != EINTR)
      throw HealthCheckError(fmt::format("waitpid: {}", std::strerror(errno)));
    if (clock_type::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &st, 0);
      throw HealthCheckError(
          fmt::format("health command timed out after {}ms", timeout.count()));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
}

} // namespace devsup
