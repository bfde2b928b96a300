#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace vramclean::util {

struct CommandResult {
  int exit_code{-1};        // 128+signo when the child was killed by a signal
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out{false};
  int spawn_errno{0};       // errno from fork/exec; non-zero means the program never ran

  [[nodiscard]] bool started() const { return spawn_errno == 0; }
  [[nodiscard]] bool ok() const { return started() && !timed_out && exit_code == 0; }
};

// Seam for running external tools so readers can be driven by canned output.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  // Run program with args, capturing stdout/stderr. The child is killed once
  // timeout elapses. Never throws for child failures; inspect the result.
  [[nodiscard]] virtual CommandResult run(const std::string& program,
                                          const std::vector<std::string>& args,
                                          std::chrono::milliseconds timeout) const = 0;
};

// fork/exec implementation with pipes and a poll() deadline.
class SubprocessRunner final : public ICommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::string& program,
                                  const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout) const override;
};

} // namespace vramclean::util
