#include "app/MemoryClearer.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <unordered_set>

#include <sys/types.h>

namespace vramclean::app {

static constexpr const char* kComponent = "clear";

int KillSignalSender::send(int pid, int signo) {
  if (::kill(static_cast<pid_t>(pid), signo) == 0) return 0;
  return errno;
}

std::string signal_failure_reason(int err) {
  switch (err) {
    case EPERM: return "permission denied";
    case ESRCH: return "no such process";
    default: return std::strerror(err);
  }
}

std::vector<model::ProcessRecord> select_targets(
    const std::vector<model::ProcessRecord>& processes, const ClearOptions& opt) {
  std::vector<model::ProcessRecord> out;
  std::unordered_set<int> seen;
  for (const auto& p : processes) {
    if (!opt.gpu_filter.empty() && !opt.gpu_filter.count(p.gpu_id)) continue;
    if (opt.exclude.count(p.pid)) continue;
    if (!seen.insert(p.pid).second) continue;
    out.push_back(p);
  }
  return out;
}

ClearResult MemoryClearer::clear(const std::vector<model::ProcessRecord>& processes,
                                 const ClearOptions& opt) {
  ClearResult res;
  res.candidates = select_targets(processes, opt);
  log_.debug(kComponent, "%zu of %zu process records selected", res.candidates.size(), processes.size());
  if (opt.dry_run) {
    res.skipped_dry_run = true;
    return res;
  }

  const int signo = opt.force ? SIGKILL : SIGTERM;
  const char* signame = opt.force ? "SIGKILL" : "SIGTERM";
  for (const auto& p : res.candidates) {
    res.attempted.push_back(p.pid);
    // kill(0) and kill(-n) address process groups, never a single process.
    if (p.pid <= 0) {
      res.failed.push_back({p.pid, "invalid pid"});
      continue;
    }
    int err = sender_.send(p.pid, signo);
    if (err == 0) {
      res.succeeded.push_back(p.pid);
      log_.debug(kComponent, "sent %s to %d (%s)", signame, p.pid, p.command.c_str());
    } else {
      res.failed.push_back({p.pid, signal_failure_reason(err)});
      log_.debug(kComponent, "failed to signal %d: %s", p.pid, res.failed.back().reason.c_str());
    }
  }
  return res;
}

std::vector<int> await_exit(const std::vector<int>& pids, std::chrono::milliseconds timeout) {
  std::vector<int> alive = pids;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    std::erase_if(alive, [](int pid){ return !util::pid_alive(pid); });
    if (alive.empty() || std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return alive;
}

} // namespace vramclean::app
