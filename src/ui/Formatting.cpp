#include "ui/Formatting.hpp"

#include <algorithm>
#include <cstdio>

namespace vramclean::ui {

static constexpr int kCommandCols = 48;

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + "~";
}

std::string format_gpu_block(const std::vector<model::GpuRecord>& gpus) {
  std::string out = "=== GPU Memory Status ===\n";
  char buf[160];
  for (const auto& g : gpus) {
    std::snprintf(buf, sizeof(buf), "GPU %d: %lluMB / %lluMB (%.1f%% used, %lluMB free)",
                  g.id, (unsigned long long)g.used_mb, (unsigned long long)g.total_mb,
                  g.percent_used(), (unsigned long long)g.free_mb());
    out += buf;
    if (!g.name.empty()) out += "  " + g.name;
    out += '\n';
  }
  return out;
}

std::string format_process_block(const std::vector<model::ProcessRecord>& procs) {
  std::string out = "=== GPU Processes ===\n";
  if (procs.empty()) return out + "No GPU processes found\n";
  char buf[96];
  for (const auto& p : procs) {
    std::string mem = std::to_string(p.memory_mb) + "MB";
    std::snprintf(buf, sizeof(buf), "PID: %-8d GPU: %-3d Memory: %-8s Command: ", p.pid, p.gpu_id, mem.c_str());
    std::string cmd = display_cols(p.command) > kCommandCols ? trunc_pad(p.command, kCommandCols) : p.command;
    out += buf + cmd + '\n';
  }
  return out;
}

std::string format_status(const model::GpuStatus& st) {
  return format_gpu_block(st.gpus) + "\n" + format_process_block(st.processes);
}

std::string format_clear_result(const app::ClearResult& r, bool force) {
  std::string out;
  const char* signame = force ? "SIGKILL" : "SIGTERM";
  // Outcome lines in the order the signals were sent.
  for (int pid : r.attempted) {
    auto it = std::find_if(r.failed.begin(), r.failed.end(), [pid](const app::ClearFailure& f){ return f.pid == pid; });
    if (it != r.failed.end())
      out += "Failed to terminate PID " + std::to_string(pid) + ": " + it->reason + '\n';
    else
      out += std::string("Sent ") + signame + " to PID " + std::to_string(pid) + '\n';
  }
  out += "\nCleared " + std::to_string(r.succeeded.size()) + "/" + std::to_string(r.candidates.size()) + " GPU processes.\n";
  return out;
}

std::string format_dry_run(const app::ClearResult& r) {
  std::string out = "DRY RUN: Would terminate " + std::to_string(r.candidates.size()) + " processes:\n";
  for (const auto& p : r.candidates) {
    out += "  PID: " + std::to_string(p.pid) + ", GPU: " + std::to_string(p.gpu_id) +
           ", Command: " + (p.command.empty() ? std::string("N/A") : p.command) + '\n';
  }
  out += "\nDry run complete. Found " + std::to_string(r.candidates.size()) + " processes to terminate.\n";
  return out;
}

} // namespace vramclean::ui
