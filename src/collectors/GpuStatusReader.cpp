#include "collectors/GpuStatusReader.hpp"
#include "collectors/SmiParser.hpp"
#include "app/Errors.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace vramclean::collectors {

static constexpr const char* kComponent = "status";

static bool is_executable(const std::string& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

// First non-empty line of stderr, else stdout; used in error messages.
static std::string first_line(const util::CommandResult& r) {
  for (const std::string* s : {&r.stderr_text, &r.stdout_text}) {
    size_t start = 0;
    while (start < s->size()) {
      size_t end = s->find('\n', start);
      std::string line = s->substr(start, end == std::string::npos ? std::string::npos : end - start);
      while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
      if (!line.empty()) return line;
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  return "exit status " + std::to_string(r.exit_code);
}

std::string locate_nvidia_smi(const std::string& configured) {
  std::string name = (configured.empty() || configured == "auto") ? std::string("nvidia-smi") : configured;
  if (name.find('/') != std::string::npos) return is_executable(name) ? name : std::string();
  if (const char* path = std::getenv("PATH")) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (is_executable(cand)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  if (name == "nvidia-smi") {
    const char* candidates[] = {"/usr/bin/nvidia-smi", "/usr/local/bin/nvidia-smi",
                                "/opt/nvidia/sbin/nvidia-smi", "/bin/nvidia-smi"};
    for (const char* c : candidates) {
      if (is_executable(c)) return c;
    }
  }
  return {};
}

GpuStatusReader::GpuStatusReader(const app::Config& cfg, const util::ICommandRunner& runner, const util::Log& log)
    : cfg_(cfg), runner_(runner), log_(log) {}

std::string GpuStatusReader::tool() const {
  std::string smi = locate_nvidia_smi(cfg_.nvidia.smi_path);
  if (smi.empty()) {
    throw app::ToolNotFoundError("nvidia-smi not found (smi_path=" + cfg_.nvidia.smi_path +
                                 "). Make sure NVIDIA drivers are installed.");
  }
  log_.debug(kComponent, "using %s", smi.c_str());
  return smi;
}

util::CommandResult GpuStatusReader::invoke(const std::string& smi, const std::vector<std::string>& args) const {
  log_.debug(kComponent, "running %s %s", smi.c_str(), args.empty() ? "" : args.front().c_str());
  auto res = runner_.run(smi, args, std::chrono::milliseconds(cfg_.nvidia.timeout_ms));
  if (!res.started()) {
    if (res.spawn_errno == ENOENT || res.spawn_errno == EACCES || res.spawn_errno == ENOEXEC) {
      throw app::ToolNotFoundError("cannot execute " + smi + ": " + std::strerror(res.spawn_errno));
    }
    throw app::ToolExecutionError("failed to start " + smi + ": " + std::strerror(res.spawn_errno));
  }
  if (res.timed_out) {
    throw app::ToolExecutionError(smi + " timed out after " + std::to_string(cfg_.nvidia.timeout_ms) + "ms");
  }
  return res;
}

std::vector<model::GpuRecord> GpuStatusReader::query_gpus(const std::string& smi) const {
  auto res = invoke(smi, {"--query-gpu=index,memory.used,memory.total,uuid,name", "--format=csv,noheader,nounits"});
  if (res.exit_code != 0) {
    throw app::ToolExecutionError("nvidia-smi GPU query failed: " + first_line(res));
  }
  auto rep = parse_gpu_table(res.stdout_text);
  for (const auto& line : rep.skipped) {
    log_.warn(kComponent, "skipping malformed GPU line: '%s'", line.c_str());
  }
  if (rep.records.empty()) {
    throw app::ParseError("no GPU records in nvidia-smi output (" + std::to_string(rep.data_lines) + " data lines)");
  }
  return std::move(rep.records);
}

std::vector<model::ProcessRecord> GpuStatusReader::query_processes(
    const std::string& smi, const std::vector<model::GpuRecord>& gpus) const {
  auto res = invoke(smi, {"--query-compute-apps=pid,gpu_uuid,used_memory,process_name", "--format=csv,noheader,nounits"});
  if (res.exit_code != 0) {
    if (cfg_.nvidia.pmon_fallback) {
      log_.debug(kComponent, "compute-apps query failed (%s), trying pmon", first_line(res).c_str());
      return query_pmon(smi);
    }
    log_.warn(kComponent, "process query failed: %s", first_line(res).c_str());
    return {};
  }
  auto rep = parse_compute_apps(res.stdout_text, gpus);
  for (const auto& line : rep.skipped) {
    log_.warn(kComponent, "skipping malformed process line: '%s'", line.c_str());
  }
  if (rep.data_lines > 0 && rep.records.empty()) {
    throw app::ParseError("no process records parsed from " + std::to_string(rep.data_lines) + " nvidia-smi lines");
  }
  for (auto& p : rep.records) {
    if (p.command.empty() || p.command == "[N/A]") {
      p.command = util::read_comm(p.pid).value_or("N/A");
    }
  }
  return std::move(rep.records);
}

std::vector<model::ProcessRecord> GpuStatusReader::query_pmon(const std::string& smi) const {
  auto res = invoke(smi, {"pmon", "-c", "1", "-s", "m"});
  if (res.exit_code != 0) {
    log_.warn(kComponent, "pmon query failed: %s", first_line(res).c_str());
    return {};
  }
  auto rep = parse_pmon(res.stdout_text);
  for (const auto& line : rep.skipped) {
    log_.warn(kComponent, "skipping malformed pmon line: '%s'", line.c_str());
  }
  if (rep.data_lines > 0 && rep.records.empty()) {
    throw app::ParseError("no process records parsed from " + std::to_string(rep.data_lines) + " pmon lines");
  }
  for (auto& p : rep.records) {
    if (p.command.empty()) p.command = util::read_comm(p.pid).value_or("N/A");
  }
  return std::move(rep.records);
}

model::GpuStatus GpuStatusReader::query_status() const {
  std::string smi = tool();
  model::GpuStatus st;
  st.gpus = query_gpus(smi);
  st.processes = query_processes(smi, st.gpus);
  log_.debug(kComponent, "%zu GPUs, %zu processes", st.gpus.size(), st.processes.size());
  return st;
}

} // namespace vramclean::collectors
