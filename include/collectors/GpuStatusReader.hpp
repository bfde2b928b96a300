#pragma once
#include "app/Config.hpp"
#include "model/Gpu.hpp"
#include "util/CommandRunner.hpp"
#include "util/Log.hpp"

#include <string>

namespace vramclean::collectors {

// Resolve the nvidia-smi binary. configured is a path, a bare name, or "auto"
// (search PATH, then well-known install locations). Empty when nothing exists.
[[nodiscard]] std::string locate_nvidia_smi(const std::string& configured);

// Queries nvidia-smi for the GPU memory table and the processes holding
// memory. Throws app::ToolNotFoundError, app::ToolExecutionError and
// app::ParseError; malformed lines are skipped with a warning.
class GpuStatusReader {
public:
  GpuStatusReader(const app::Config& cfg, const util::ICommandRunner& runner, const util::Log& log);

  [[nodiscard]] model::GpuStatus query_status() const;

private:
  [[nodiscard]] std::string tool() const;
  [[nodiscard]] util::CommandResult invoke(const std::string& smi, const std::vector<std::string>& args) const;
  [[nodiscard]] std::vector<model::GpuRecord> query_gpus(const std::string& smi) const;
  [[nodiscard]] std::vector<model::ProcessRecord> query_processes(
      const std::string& smi, const std::vector<model::GpuRecord>& gpus) const;
  [[nodiscard]] std::vector<model::ProcessRecord> query_pmon(const std::string& smi) const;

  const app::Config& cfg_;
  const util::ICommandRunner& runner_;
  const util::Log& log_;
};

} // namespace vramclean::collectors
