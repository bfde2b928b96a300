#pragma once

#include <set>
#include <string>
#include <string_view>

namespace vramclean::app {

struct CliOptions {
  bool status{false};
  bool clear{false};
  bool force{false};
  bool dry_run{false};
  bool verbose{false};
  bool help{false};
  std::set<int> gpus;
  std::set<int> exclude;
  std::string config_path;
};

// Parses argv; throws UsageError on unknown flags or bad id lists.
// With neither --status nor --clear, status is implied.
[[nodiscard]] CliOptions parse_cli(int argc, const char* const* argv);

// "0,1,3" -> {0,1,3}. Empty elements are ignored; anything that is not a
// non-negative integer throws UsageError naming the flag.
[[nodiscard]] std::set<int> parse_id_list(std::string_view csv, std::string_view flag);

[[nodiscard]] std::string usage_text();

} // namespace vramclean::app
