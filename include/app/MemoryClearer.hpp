#pragma once
#include "model/Gpu.hpp"
#include "util/Log.hpp"

#include <chrono>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vramclean::app {

// Seam over kill(2) so the clearer can be exercised without real processes.
class SignalSender {
public:
  virtual ~SignalSender() = default;
  // Returns 0 on success, otherwise an errno value.
  [[nodiscard]] virtual int send(int pid, int signo) = 0;
};

class KillSignalSender final : public SignalSender {
public:
  [[nodiscard]] int send(int pid, int signo) override;
};

struct ClearOptions {
  std::set<int> gpu_filter;   // empty = every GPU
  std::set<int> exclude;
  bool force{false};          // SIGKILL instead of SIGTERM
  bool dry_run{false};
};

struct ClearFailure {
  int pid{};
  std::string reason;
};

struct ClearResult {
  std::vector<model::ProcessRecord> candidates;   // filtered set; "would terminate" in a dry run
  std::vector<int> attempted;
  std::vector<int> succeeded;
  std::vector<ClearFailure> failed;
  bool skipped_dry_run{false};
};

// Human-readable reason for a kill(2) errno.
[[nodiscard]] std::string signal_failure_reason(int err);

// Records kept by the GPU/PID filters, each PID once, in input order.
[[nodiscard]] std::vector<model::ProcessRecord> select_targets(
    const std::vector<model::ProcessRecord>& processes, const ClearOptions& opt);

class MemoryClearer {
public:
  MemoryClearer(SignalSender& sender, const util::Log& log) : sender_(sender), log_(log) {}

  // Filter, then signal each survivor once. Per-PID failures land in
  // ClearResult::failed and never stop the batch.
  [[nodiscard]] ClearResult clear(const std::vector<model::ProcessRecord>& processes,
                                  const ClearOptions& opt);

private:
  SignalSender& sender_;
  const util::Log& log_;
};

// Poll /proc until every pid has exited or timeout elapses; returns the
// pids still alive.
[[nodiscard]] std::vector<int> await_exit(const std::vector<int>& pids, std::chrono::milliseconds timeout);

} // namespace vramclean::app
