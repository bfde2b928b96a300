#include "collectors/SmiParser.hpp"

#include <cctype>
#include <charconv>
#include <limits>

namespace vramclean::collectors {

static std::string_view trim(std::string_view sv) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!sv.empty() && issp(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && issp(sv.back())) sv.remove_suffix(1);
  return sv;
}

static std::vector<std::string_view> split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    if (i > start) out.push_back(sv.substr(start, i - start));
  }
  return out;
}

// Calls fn(line) for every line of text, CRLF tolerant.
template <typename Fn>
static void for_each_line(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    auto nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    fn(line);
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }
}

static bool is_data_line(std::string_view line) {
  auto t = trim(line);
  return !t.empty() && t.front() != '#';
}

static std::optional<int32_t> to_i32(std::string_view field) {
  auto v = parse_mib(field);
  if (!v || *v > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) return std::nullopt;
  return static_cast<int32_t>(*v);
}

std::optional<uint64_t> parse_mib(std::string_view field) {
  field = trim(field);
  if (field.empty()) return std::nullopt;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), v);
  if (ec != std::errc{} || ptr == field.data()) return std::nullopt;
  for (const char* p = ptr; p != field.data() + field.size(); ++p) {
    if (std::isdigit(static_cast<unsigned char>(*p))) return std::nullopt;
  }
  return v;
}

std::vector<std::string_view> split_fields(std::string_view line, size_t max_fields) {
  std::vector<std::string_view> out;
  while (true) {
    if (max_fields && out.size() + 1 == max_fields) { out.push_back(trim(line)); break; }
    auto comma = line.find(',');
    out.push_back(trim(line.substr(0, comma)));
    if (comma == std::string_view::npos) break;
    line.remove_prefix(comma + 1);
  }
  return out;
}

std::optional<PmonColumns> PmonColumns::from_header(std::string_view line) {
  line = trim(line);
  if (line.empty() || line.front() != '#') return std::nullopt;
  line.remove_prefix(1);
  auto names = split_ws(line);
  PmonColumns cols;
  bool have_pid = false;
  for (size_t i = 0; i < names.size(); ++i) {
    int idx = static_cast<int>(i);
    if (names[i] == "gpu") cols.gpu = idx;
    else if (names[i] == "pid") { cols.pid = idx; have_pid = true; }
    else if (names[i] == "fb") cols.fb = idx;
    else if (names[i] == "command") cols.command = idx;
  }
  if (!have_pid) return std::nullopt;
  return cols;
}

std::optional<model::GpuRecord> parse_gpu_line(std::string_view line) {
  auto f = split_fields(line, GpuColumns::count);
  if (f.size() < GpuColumns::required) return std::nullopt;
  auto id = to_i32(f[GpuColumns::index]);
  auto used = parse_mib(f[GpuColumns::used]);
  auto total = parse_mib(f[GpuColumns::total]);
  if (!id || !used || !total) return std::nullopt;
  model::GpuRecord g;
  g.id = *id;
  g.used_mb = *used;
  g.total_mb = *total;
  if (f.size() > GpuColumns::uuid) g.uuid = std::string(f[GpuColumns::uuid]);
  if (f.size() > GpuColumns::name) g.name = std::string(f[GpuColumns::name]);
  return g;
}

std::optional<model::ProcessRecord> parse_compute_app_line(
    std::string_view line, const std::vector<model::GpuRecord>& gpus) {
  auto f = split_fields(line, ComputeAppColumns::count);
  if (f.size() < ComputeAppColumns::required) return std::nullopt;
  auto pid = to_i32(f[ComputeAppColumns::pid]);
  auto mem = parse_mib(f[ComputeAppColumns::used]);
  if (!pid || *pid <= 0 || !mem) return std::nullopt;

  std::optional<int32_t> gpu_id;
  std::string_view gpu = f[ComputeAppColumns::gpu];
  for (const auto& g : gpus) {
    if (!g.uuid.empty() && g.uuid == gpu) { gpu_id = g.id; break; }
  }
  if (!gpu_id) gpu_id = to_i32(gpu);
  if (!gpu_id) return std::nullopt;

  model::ProcessRecord p;
  p.pid = *pid;
  p.gpu_id = *gpu_id;
  p.memory_mb = *mem;
  if (f.size() > ComputeAppColumns::name) p.command = std::string(f[ComputeAppColumns::name]);
  return p;
}

std::optional<model::ProcessRecord> parse_pmon_line(std::string_view line, const PmonColumns& cols) {
  auto t = split_ws(line);
  int n = static_cast<int>(t.size());
  if (cols.gpu >= n || cols.pid >= n || cols.fb >= n || cols.command >= n) return std::nullopt;
  auto gpu = to_i32(t[cols.gpu]);
  auto pid = to_i32(t[cols.pid]);
  auto fb = parse_mib(t[cols.fb]);
  if (!gpu || !pid || *pid <= 0 || !fb) return std::nullopt;
  model::ProcessRecord p;
  p.pid = *pid;
  p.gpu_id = *gpu;
  p.memory_mb = *fb;
  int first = cols.command >= 0 ? cols.command : n - 1;
  if (first > cols.fb && first > cols.pid) {
    for (int i = first; i < n; ++i) {
      if (!p.command.empty()) p.command += ' ';
      p.command.append(t[i]);
    }
  }
  if (p.command == "-") p.command.clear();
  return p;
}

ParseReport<model::GpuRecord> parse_gpu_table(std::string_view text) {
  ParseReport<model::GpuRecord> rep;
  for_each_line(text, [&](std::string_view line){
    if (!is_data_line(line)) return;
    rep.data_lines++;
    if (auto g = parse_gpu_line(line)) rep.records.push_back(std::move(*g));
    else rep.skipped.emplace_back(line);
  });
  return rep;
}

ParseReport<model::ProcessRecord> parse_compute_apps(
    std::string_view text, const std::vector<model::GpuRecord>& gpus) {
  ParseReport<model::ProcessRecord> rep;
  for_each_line(text, [&](std::string_view line){
    if (!is_data_line(line)) return;
    rep.data_lines++;
    if (auto p = parse_compute_app_line(line, gpus)) rep.records.push_back(std::move(*p));
    else rep.skipped.emplace_back(line);
  });
  return rep;
}

ParseReport<model::ProcessRecord> parse_pmon(std::string_view text) {
  ParseReport<model::ProcessRecord> rep;
  PmonColumns cols;
  bool have_header = false;
  for_each_line(text, [&](std::string_view line){
    if (!is_data_line(line)) {
      if (!have_header) {
        if (auto h = PmonColumns::from_header(line)) { cols = *h; have_header = true; }
      }
      return;
    }
    auto t = split_ws(line);
    if (cols.pid < static_cast<int>(t.size()) && t[cols.pid] == "-") return; // idle GPU row
    rep.data_lines++;
    if (auto p = parse_pmon_line(line, cols)) rep.records.push_back(std::move(*p));
    else rep.skipped.emplace_back(line);
  });
  return rep;
}

} // namespace vramclean::collectors
