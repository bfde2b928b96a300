#include "util/Procfs.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace vramclean::util {

static std::string proc_root() {
  const char* env = std::getenv("VRAMCLEAN_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt; // vanished between open and read
  return s;
}

auto pid_alive(int pid) -> bool {
  if (pid <= 0) return false;
  auto stat = read_file_string("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;
  // Format: "pid (comm) S ..."; comm may contain spaces and parens.
  auto rp = stat->rfind(')');
  if (rp == std::string::npos || rp + 2 >= stat->size()) return true;
  char state = (*stat)[rp + 2];
  return state != 'Z' && state != 'X';
}

auto read_comm(int pid) -> std::optional<std::string> {
  auto txt = read_file_string("/proc/" + std::to_string(pid) + "/comm");
  if (!txt) return std::nullopt;
  while (!txt->empty() && (txt->back() == '\n' || txt->back() == '\r')) txt->pop_back();
  if (txt->empty()) return std::nullopt;
  return txt;
}

} // namespace vramclean::util
