#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vramclean::model {

// One row of the GPU memory table, in MiB as reported by nvidia-smi.
struct GpuRecord {
  int32_t id{};
  uint64_t used_mb{};
  uint64_t total_mb{};
  std::string uuid;   // empty when the tool did not report it
  std::string name;

  [[nodiscard]] uint64_t free_mb() const { return total_mb > used_mb ? total_mb - used_mb : 0; }
  [[nodiscard]] double percent_used() const {
    return total_mb ? (100.0 * static_cast<double>(used_mb) / static_cast<double>(total_mb)) : 0.0;
  }
};

// One process holding memory on one GPU. A process spanning several GPUs
// shows up once per GPU.
struct ProcessRecord {
  int32_t pid{};
  int32_t gpu_id{};
  uint64_t memory_mb{};
  std::string command;
};

struct GpuStatus {
  std::vector<GpuRecord> gpus;
  std::vector<ProcessRecord> processes;
};

} // namespace vramclean::model
