#pragma once
// Minimal HTTP/1.0 responder for health-check tests. Binds 127.0.0.1 on an
// ephemeral port and answers every request with a fixed status, or never
// answers at all. In https mode it serves a throwaway self-signed certificate.
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace devsup::test {

class HttpStub {
public:
  static constexpr int kHang = 0;
  enum class Scheme { Http, Https };

  explicit HttpStub(int status, Scheme scheme = Scheme::Http) : status_(status) {
    if (scheme == Scheme::Https)
      ctx_ = make_server_ctx();
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      SSL_CTX_free(ctx_);
      throw std::runtime_error("socket");
    }
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    a.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr *>(&a), sizeof(a)) != 0 ||
        ::listen(fd_, 16) != 0) {
      ::close(fd_);
      SSL_CTX_free(ctx_);
      throw std::runtime_error("bind/listen");
    }
    socklen_t len = sizeof(a);
    ::getsockname(fd_, reinterpret_cast<sockaddr *>(&a), &len);
    port_ = ntohs(a.sin_port);
    th_ = std::thread([this] { loop(); });
  }

  ~HttpStub() {
    stop_ = true;
    if (th_.joinable())
      th_.join();
    for (auto& h : held_) {
      if (h.ssl)
        SSL_free(h.ssl);
      ::close(h.fd);
    }
    ::close(fd_);
    SSL_CTX_free(ctx_);
  }

  HttpStub(const HttpStub &) = delete;
  HttpStub& operator=(const HttpStub &) = delete;

  void set_status(int s) { status_ = s; }
  int port() const { return port_; }
  int requests() const { return requests_.load(); }
  std::string url(const std::string& path = "/health") const {
    return std::string(ctx_ ? "https" : "http") + "://127.0.0.1:" +
           std::to_string(port_) + path;
  }

private:
  struct Conn {
    int fd = -1;
    SSL *ssl = nullptr;
  };

  static SSL_CTX *make_server_ctx() {
    EVP_PKEY *key = EVP_EC_gen("P-256");
    X509 *cert = X509_new();
    if (!key || !cert) {
      EVP_PKEY_free(key);
      X509_free(cert);
      throw std::runtime_error("tls keygen");
    }
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
    X509_set_pubkey(cert, key);
    X509_NAME *name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char *>("127.0.0.1"),
                               -1, -1, 0);
    X509_set_issuer_name(cert, name);
    X509_sign(cert, key, EVP_sha256());

    SSL_CTX *ctx = SSL_CTX_new(TLS_server_method());
    bool ok = ctx && SSL_CTX_use_certificate(ctx, cert) == 1 &&
              SSL_CTX_use_PrivateKey(ctx, key) == 1;
    X509_free(cert);
    EVP_PKEY_free(key);
    if (!ok) {
      SSL_CTX_free(ctx);
      throw std::runtime_error("tls context");
    }
    return ctx;
  }

  void loop() {
    while (!stop_) {
      pollfd p{fd_, POLLIN, 0};
      if (::poll(&p, 1, 50) <= 0)
        continue;
      Conn c;
      c.fd = ::accept(fd_, nullptr, nullptr);
      if (c.fd < 0)
        continue;
      if (ctx_ && !handshake(c)) {
        close_conn(c);
        continue;
      }
      read_request(c);
      ++requests_;
      int s = status_.load();
      if (s == kHang) {
        held_.push_back(c);
        continue;
      }
      std::string resp = "HTTP/1.0 " + std::to_string(s) +
                         " Stub\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
      if (c.ssl) {
        SSL_write(c.ssl, resp.data(), static_cast<int>(resp.size()));
        SSL_shutdown(c.ssl);
      } else {
        ::send(c.fd, resp.data(), resp.size(), MSG_NOSIGNAL);
      }
      close_conn(c);
    }
  }

  bool handshake(Conn& c) {
    timeval tv{0, 500000};
    ::setsockopt(c.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(c.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    c.ssl = SSL_new(ctx_);
    if (!c.ssl)
      return false;
    SSL_set_fd(c.ssl, c.fd);
    return SSL_accept(c.ssl) == 1;
  }

  static void close_conn(Conn& c) {
    if (c.ssl)
      SSL_free(c.ssl);
    ::close(c.fd);
  }

  void read_request(const Conn& c) {
    std::string req;
    char buf[1024];
    while (req.find("\r\n\r\n") == std::string::npos) {
      if (!c.ssl || SSL_pending(c.ssl) == 0) {
        pollfd p{c.fd, POLLIN, 0};
        if (::poll(&p, 1, 500) <= 0)
          return;
      }
      int n = c.ssl ? SSL_read(c.ssl, buf, static_cast<int>(sizeof(buf)))
                    : static_cast<int>(::recv(c.fd, buf, sizeof(buf), 0));
      if (n <= 0)
        return;
      req.append(buf, static_cast<size_t>(n));
    }
  }

  int fd_ = -1;
  int port_ = 0;
  std::atomic<int> status_;
  std::atomic<int> requests_{0};
  std::atomic_bool stop_{false};
  SSL_CTX *ctx_ = nullptr;
  std::vector<Conn> held_;
  std::thread th_;
};

} // namespace devsup::test
