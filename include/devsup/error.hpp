#pragma once
#include <stdexcept>
#include <string>

namespace devsup {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Executable missing or not launchable. Carries the errno of the failure.
class SpawnError : public Error {
public:
  SpawnError(const std::string& service, int err);
  int code() const { return code_; }

private:
  int code_;
};

class NotFound : public Error {
public:
  explicit NotFound(const std::string& service)
      : Error("service not found: " + service) {}
};

class ConfigError : public Error {
public:
  using Error::Error;
};

class HealthCheckError : public Error {
public:
  using Error::Error;
};

class SignalError : public Error {
public:
  SignalError(int pid, int sig, int err);
};

class IoError : public Error {
public:
  using Error::Error;
};

} // namespace devsup
