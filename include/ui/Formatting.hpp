#pragma once

#include "app/MemoryClearer.hpp"
#include "model/Gpu.hpp"

#include <string>

namespace vramclean::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);
std::string trunc_pad(const std::string& s, int w);

// "=== GPU Memory Status ===" block, one line per GPU.
std::string format_gpu_block(const std::vector<model::GpuRecord>& gpus);
// "=== GPU Processes ===" block, or "No GPU processes found".
std::string format_process_block(const std::vector<model::ProcessRecord>& procs);
std::string format_status(const model::GpuStatus& st);

// Per-PID outcome lines followed by "Cleared k/n GPU processes."
std::string format_clear_result(const app::ClearResult& r, bool force);
// "DRY RUN: Would terminate n processes:" listing and closing summary.
std::string format_dry_run(const app::ClearResult& r);

} // namespace vramclean::ui
