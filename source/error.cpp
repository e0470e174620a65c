#include <devsup/error.hpp>

#include <fmt/format.h>

#include <cstring>

namespace devsup {

SpawnError::SpawnError(const std::string& service, int err)
    : Error(fmt::format("failed to spawn {}: {}", service, std::strerror(err))),
      code_(err) {}

SignalError::SignalError(int pid, int sig, int err)
    : Error(fmt::format("kill(pid={}, sig={}) failed: {}", pid, sig,
                        std::strerror(err))) {}

} // namespace devsup
