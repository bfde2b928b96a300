#include "util/CommandRunner.hpp"

#include <cerrno>
#include <csignal>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vramclean::util {

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }
  UniqueFd(UniqueFd&& o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  UniqueFd& operator=(UniqueFd&& o) noexcept {
    if (this != &o) { reset(); fd_ = std::exchange(o.fd_, -1); }
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  [[nodiscard]] int get() const { return fd_; }
  void reset() { if (fd_ >= 0) ::close(fd_); fd_ = -1; }

private:
  int fd_{-1};
};

bool make_pipe(UniqueFd& rd, UniqueFd& wr) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
  rd = UniqueFd(fds[0]);
  wr = UniqueFd(fds[1]);
  return true;
}

// Drain whatever is readable; returns false once the writer side is closed.
bool drain(int fd, std::string& out) {
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); if (static_cast<size_t>(n) < sizeof(buf)) return true; continue; }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

int reap(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

CommandResult SubprocessRunner::run(const std::string& program,
                                    const std::vector<std::string>& args,
                                    std::chrono::milliseconds timeout) const {
  CommandResult res;

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(program.c_str()));
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  UniqueFd out_r, out_w, err_r, err_w, st_r, st_w;
  if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(st_r, st_w)) {
    res.spawn_errno = errno;
    return res;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    res.spawn_errno = errno;
    return res;
  }
  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_w.get(), STDOUT_FILENO);
    ::dup2(err_w.get(), STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    int e = errno;
    if (::write(st_w.get(), &e, sizeof(e)) < 0) { /* parent sees EOF and a 127 exit */ }
    ::_exit(127);
  }

  out_w.reset(); err_w.reset(); st_w.reset();

  // The status pipe closes on successful exec (O_CLOEXEC) or carries errno.
  int child_errno = 0;
  ssize_t n;
  do { n = ::read(st_r.get(), &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    reap(pid);
    res.spawn_errno = child_errno ? child_errno : ENOEXEC;
    return res;
  }

  ::fcntl(out_r.get(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_r.get(), F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool out_open = true, err_open = true;
  bool abandon = false;
  while (out_open || err_open) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) { res.timed_out = true; break; }
    pollfd fds[2];
    nfds_t nf = 0;
    if (out_open) fds[nf++] = pollfd{out_r.get(), POLLIN, 0};
    if (err_open) fds[nf++] = pollfd{err_r.get(), POLLIN, 0};
    int pr = ::poll(fds, nf, static_cast<int>(left.count()));
    if (pr < 0) {
      if (errno == EINTR) continue;
      abandon = true;
      break;
    }
    if (pr == 0) continue;
    for (nfds_t i = 0; i < nf; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      if (fds[i].fd == out_r.get()) out_open = drain(out_r.get(), res.stdout_text);
      else err_open = drain(err_r.get(), res.stderr_text);
    }
  }

  if (res.timed_out || abandon) ::kill(pid, SIGKILL);
  res.exit_code = reap(pid);
  return res;
}

} // namespace vramclean::util
