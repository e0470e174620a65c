#include <devsup/child.hpp>
#include <devsup/error.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

extern char **environ;

namespace fs = std::filesystem;

namespace devsup {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_all(std::initializer_list<int> fds) {
  for (int fd : fds)
    if (fd >= 0)
      ::close(fd);
}

static int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// Inherited environment with the service overrides applied.
static std::vector<std::string> build_env(const ServiceConfig& c) {
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto key = kv.substr(0, kv.find('='));
    if (c.env.find(key) == c.env.end())
      out.push_back(std::move(kv));
  }
  for (auto &[k, v] : c.env)
    out.push_back(k + "=" + v);
  return out;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ServiceConfig& c) {
  int outfd = -1, errfd = -1;
  int out_r = -1, err_r = -1;

  if (c.log_file) {
    std::error_code ec;
    if (c.log_file->has_parent_path())
      fs::create_directories(c.log_file->parent_path(), ec);
    outfd = ::open(c.log_file->c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
                   0644);
    if (outfd < 0)
      throw IoError("open: " + c.log_file->string() + ": " +
                    std::strerror(errno));
    errfd = ::fcntl(outfd, F_DUPFD_CLOEXEC, 0);
    if (errfd < 0) {
      int err = errno;
      ::close(outfd);
      throw IoError("fcntl(F_DUPFD_CLOEXEC): " +
                    std::string(std::strerror(err)));
    }
  } else {
    int po[2], pe[2];
    if (make_cloexec_pipe(po) != 0)
      throw SpawnError(c.name, errno);
    if (make_cloexec_pipe(pe) != 0) {
      int err = errno;
      close_all({po[0], po[1]});
      throw SpawnError(c.name, err);
    }
    out_r = po[0];
    outfd = po[1];
    err_r = pe[0];
    errfd = pe[1];
  }

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) {
    int err = errno;
    close_all({outfd, errfd, out_r, err_r});
    throw SpawnError(c.name, err);
  }

  // everything the child touches is prepared before fork
  std::vector<std::string> argv_s;
  argv_s.push_back(c.command);
  argv_s.insert(argv_s.end(), c.args.begin(), c.args.end());
  std::vector<char *> argv;
  argv.reserve(argv_s.size() + 1);
  for (auto& s : argv_s)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  auto env_s = build_env(c);
  std::vector<char *> envp;
  envp.reserve(env_s.size() + 1);
  for (auto& s : env_s)
    envp.push_back(const_cast<char *>(s.c_str()));
  envp.push_back(nullptr);

  const std::string cwd = c.working_dir.string();

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    close_all({outfd, errfd, out_r, err_r, pfd[0], pfd[1]});
    throw SpawnError(c.name, err);
  }

  if (pid == 0) {
    ::close(pfd[0]);
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(outfd, STDOUT_FILENO);
    ::dup2(errfd, STDERR_FILENO);

    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      int err = errno;
      (void)!::write(pfd[1], &err, sizeof(err));
      _exit(127);
    }

    environ = envp.data();
    ::execvp(argv[0], argv.data());

    int err = errno;
    (void)!::write(pfd[1], &err, sizeof(err));
    _exit(127);
  }

  // parent: also set the group here to avoid racing a signal against setpgid
  ::setpgid(pid, pid);
  close_all({outfd, errfd, pfd[1]});

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(pfd[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(pfd[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    close_all({out_r, err_r});
    spdlog::error("[svc={}] exec failed (errno={}): {}", c.name, child_errno,
                  std::strerror(child_errno));
    throw SpawnError(c.name, child_errno);
  }

  auto child = std::make_unique<ChildProcess>(c.name, pid);
  if (out_r >= 0)
    child->start_pump(out_r, err_r);
  spdlog::debug("[svc={}] spawned pid={}", c.name, pid);
  return child;
}

ChildProcess::~ChildProcess() {
  if (!exited_ && pid_ > 0) {
    spdlog::warn("[svc={}] handle dropped while running; killing pid={}", name_,
                 pid_);
    kill();
  }
  stop_pump();
}

std::optional<int> ChildProcess::exit_code() const {
  if (!exited_)
    return std::nullopt;
  return exit_code_;
}

void ChildProcess::signal(int sig) {
  if (exited_ || pid_ <= 0)
    return;
  if (::kill(-pid_, sig) == 0)
    return;
  if (errno == ESRCH) {
    // not a group leader (yet); fall back to the pid itself
    if (::kill(pid_, sig) == 0 || errno == ESRCH)
      return;
  }
  throw SignalError(pid_, sig, errno);
}

std::optional<int> ChildProcess::try_wait() {
  if (exited_)
    return exit_code_;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    exited_ = true;
    exit_code_ = decode_status(status);
    return exit_code_;
  }
  if (r < 0 && errno == ECHILD) {
    exited_ = true;
    exit_code_ = -1;
    return exit_code_;
  }
  return std::nullopt;
}

bool ChildProcess::wait_for(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (try_wait())
      return true;
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

void ChildProcess::kill() {
  if (exited_ || pid_ <= 0)
    return;
  ::kill(-pid_, SIGKILL);
  ::kill(pid_, SIGKILL);
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  exited_ = true;
  exit_code_ = (r == pid_) ? decode_status(status) : 137;
}

void ChildProcess::start_pump(int out_fd, int err_fd) {
  pump_ = std::thread([this, out_fd, err_fd] {
    struct Stream {
      int fd;
      const char *tag;
      std::string buf;
    };
    Stream streams[2] = {{out_fd, "stdout", {}}, {err_fd, "stderr", {}}};
    int open_count = 2;
    char chunk[4096];

    while (open_count > 0 && !pump_stop_.load()) {
      pollfd pfds[2];
      nfds_t n = 0;
      Stream *map[2];
      for (auto& s : streams) {
        if (s.fd < 0)
          continue;
        pfds[n] = {s.fd, POLLIN, 0};
        map[n++] = &s;
      }
      int rc = ::poll(pfds, n, 100);
      if (rc <= 0)
        continue;
      for (nfds_t i = 0; i < n; ++i) {
        if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
          continue;
        Stream& s = *map[i];
        ssize_t got = ::read(s.fd, chunk, sizeof(chunk));
        if (got <= 0) {
          if (!s.buf.empty())
            spdlog::debug("[svc={}] {}: {}", name_, s.tag, s.buf);
          ::close(s.fd);
          s.fd = -1;
          --open_count;
          continue;
        }
        s.buf.append(chunk, static_cast<size_t>(got));
        size_t pos;
        while ((pos = s.buf.find('\n')) != std::string::npos) {
          spdlog::debug("[svc={}] {}: {}", name_, s.tag, s.buf.substr(0, pos));
          s.buf.erase(0, pos + 1);
        }
      }
    }
    for (auto& s : streams)
      if (s.fd >= 0)
        ::close(s.fd);
  });
}

void ChildProcess::stop_pump() {
  pump_stop_ = true;
  if (pump_.joinable())
    pump_.join();
}

} // namespace devsup
