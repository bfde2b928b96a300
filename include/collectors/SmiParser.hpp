#pragma once
#include "model/Gpu.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vramclean::collectors {

// Column order of: nvidia-smi --query-gpu=index,memory.used,memory.total,uuid,name
//                  --format=csv,noheader,nounits
struct GpuColumns {
  static constexpr size_t index = 0;
  static constexpr size_t used = 1;
  static constexpr size_t total = 2;
  static constexpr size_t uuid = 3;
  static constexpr size_t name = 4;   // remainder of the line
  static constexpr size_t required = 3;
  static constexpr size_t count = 5;
};

// Column order of: nvidia-smi --query-compute-apps=pid,gpu_uuid,used_memory,process_name
//                  --format=csv,noheader,nounits
struct ComputeAppColumns {
  static constexpr size_t pid = 0;
  static constexpr size_t gpu = 1;    // GPU UUID, or a plain index
  static constexpr size_t used = 2;
  static constexpr size_t name = 3;   // remainder of the line
  static constexpr size_t required = 3;
  static constexpr size_t count = 4;
};

// Whitespace columns of `nvidia-smi pmon -s m`, located by the "# gpu pid ..."
// header when present. command < 0 means "from the last column".
struct PmonColumns {
  int gpu{0};
  int pid{1};
  int fb{3};
  int command{-1};

  [[nodiscard]] static std::optional<PmonColumns> from_header(std::string_view line);
};

// Lines parsed vs. lines rejected for one tool output.
template <typename T>
struct ParseReport {
  std::vector<T> records;
  size_t data_lines{0};
  std::vector<std::string> skipped;   // raw text of rejected data lines
};

// Leading digits of a numeric field; a trailing unit such as "MiB" is ignored.
// "[N/A]", "-", "" and "1.5" yield nullopt.
[[nodiscard]] std::optional<uint64_t> parse_mib(std::string_view field);

// Comma split with whitespace trimming. With max_fields > 0 the last field
// keeps the rest of the line, commas included.
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line, size_t max_fields = 0);

// Single-line parsers: nullopt for a malformed line, never throw.
[[nodiscard]] std::optional<model::GpuRecord> parse_gpu_line(std::string_view line);
[[nodiscard]] std::optional<model::ProcessRecord> parse_compute_app_line(
    std::string_view line, const std::vector<model::GpuRecord>& gpus);
[[nodiscard]] std::optional<model::ProcessRecord> parse_pmon_line(
    std::string_view line, const PmonColumns& cols);

// Whole-output parsers. Blank lines and '#' lines are not data lines.
[[nodiscard]] ParseReport<model::GpuRecord> parse_gpu_table(std::string_view text);
[[nodiscard]] ParseReport<model::ProcessRecord> parse_compute_apps(
    std::string_view text, const std::vector<model::GpuRecord>& gpus);
// Idle rows ("0  -  -  -  -  -") are neither records nor skipped lines.
[[nodiscard]] ParseReport<model::ProcessRecord> parse_pmon(std::string_view text);

} // namespace vramclean::collectors
