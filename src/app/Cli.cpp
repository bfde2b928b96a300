#include "app/Cli.hpp"
#include "app/Errors.hpp"

#include <charconv>

namespace vramclean::app {

std::set<int> parse_id_list(std::string_view csv, std::string_view flag) {
  std::set<int> out;
  while (true) {
    auto comma = csv.find(',');
    auto item = csv.substr(0, comma);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    if (!item.empty()) {
      int v = -1;
      auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), v);
      if (ec != std::errc{} || ptr != item.data() + item.size() || v < 0) {
        throw UsageError(std::string(flag) + ": invalid id '" + std::string(item) + "'");
      }
      out.insert(v);
    }
    if (comma == std::string_view::npos) break;
    csv.remove_prefix(comma + 1);
  }
  return out;
}

std::string usage_text() {
  return
    "Usage: vramclean [options]\n"
    "Free GPU memory by terminating the processes nvidia-smi reports.\n"
    "\n"
    "  -s, --status          show GPU memory status and processes (default)\n"
    "  -c, --clear           terminate GPU processes\n"
    "  -f, --force           use SIGKILL instead of SIGTERM\n"
    "  -g, --gpu IDS         comma-separated GPU ids to target, e.g. 0,1\n"
    "  -e, --exclude PIDS    comma-separated PIDs never to terminate\n"
    "  -d, --dry-run         show what would be terminated\n"
    "  -v, --verbose         print diagnostics on stderr\n"
    "      --config PATH     read configuration from PATH\n"
    "  -h, --help            show this help\n"
    "\n"
    "Examples:\n"
    "  vramclean --clear --gpu 0,1           clear processes on GPU 0 and 1\n"
    "  vramclean --clear --exclude 1234,5678 clear all except PIDs 1234, 5678\n"
    "  vramclean --clear --dry-run           show what would be cleared\n";
}

CliOptions parse_cli(int argc, const char* const* argv) {
  CliOptions o;
  auto need_value = [&](int& i, std::string_view flag) -> std::string_view {
    if (i + 1 >= argc) throw UsageError(std::string(flag) + " requires a value");
    return argv[++i];
  };
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a.starts_with("--")) {
      std::string_view name = a, value;
      bool inline_value = false;
      if (auto eq = a.find('='); eq != std::string_view::npos) {
        name = a.substr(0, eq); value = a.substr(eq + 1); inline_value = true;
      }
      auto flag_only = [&]{ if (inline_value) throw UsageError(std::string(name) + " takes no value"); };
      if (name == "--status") { flag_only(); o.status = true; }
      else if (name == "--clear") { flag_only(); o.clear = true; }
      else if (name == "--force") { flag_only(); o.force = true; }
      else if (name == "--dry-run") { flag_only(); o.dry_run = true; }
      else if (name == "--verbose") { flag_only(); o.verbose = true; }
      else if (name == "--help") { flag_only(); o.help = true; }
      else if (name == "--gpu") { auto ids = parse_id_list(inline_value ? value : need_value(i, name), name); o.gpus.insert(ids.begin(), ids.end()); }
      else if (name == "--exclude") { auto ids = parse_id_list(inline_value ? value : need_value(i, name), name); o.exclude.insert(ids.begin(), ids.end()); }
      else if (name == "--config") { o.config_path = std::string(inline_value ? value : need_value(i, name)); }
      else throw UsageError("unknown option " + std::string(name));
      continue;
    }
    if (a.size() < 2 || a[0] != '-') throw UsageError("unexpected argument '" + std::string(a) + "'");
    // Bundled short flags: -cfd, -g0,1, -g 0,1
    for (size_t k = 1; k < a.size(); ++k) {
      char c = a[k];
      if (c == 'g' || c == 'e') {
        std::string flag = c == 'g' ? "-g" : "-e";
        std::string_view value = (k + 1 < a.size()) ? a.substr(k + 1) : need_value(i, flag);
        auto ids = parse_id_list(value, flag);
        (c == 'g' ? o.gpus : o.exclude).insert(ids.begin(), ids.end());
        break;
      }
      switch (c) {
        case 's': o.status = true; break;
        case 'c': o.clear = true; break;
        case 'f': o.force = true; break;
        case 'd': o.dry_run = true; break;
        case 'v': o.verbose = true; break;
        case 'h': o.help = true; break;
        default: throw UsageError(std::string("unknown option -") + c);
      }
    }
  }
  if (!o.status && !o.clear) o.status = true;
  return o;
}

} // namespace vramclean::app
