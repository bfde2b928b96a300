#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vramclean::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VRAMCLEAN_", 0) == 0) {
    alt = std::string("vramclean_") + n.substr(10);
  } else if (n.rfind("vramclean_", 0) == 0) {
    alt = std::string("VRAMCLEAN_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

static std::vector<int> env_int_list(const char* name) {
  std::vector<int> out;
  const char* v = getenv_compat(name);
  if (!v) return out;
  std::string_view sv(v);
  while (!sv.empty()) {
    auto comma = sv.find(',');
    auto item = sv.substr(0, comma);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    int x = 0;
    auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), x);
    if (!item.empty() && ec == std::errc{} && ptr == item.data() + item.size()) out.push_back(x);
    if (comma == std::string_view::npos) break;
    sv.remove_prefix(comma + 1);
  }
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vramclean/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vramclean/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  std::string file = path.empty() ? config_file_path() : path;
  bool have_toml = !file.empty() && toml.load(file);

  // --- [nvidia] ---
  c.nvidia.smi_path      = resolve_string(toml, have_toml, "nvidia", "smi_path",      "VRAMCLEAN_NVIDIA_SMI_PATH", c.nvidia.smi_path);
  c.nvidia.timeout_ms    = resolve_int(toml, have_toml, "nvidia", "timeout_ms",       "VRAMCLEAN_SMI_TIMEOUT_MS", c.nvidia.timeout_ms);
  c.nvidia.pmon_fallback = resolve_bool(toml, have_toml, "nvidia", "pmon_fallback",   "VRAMCLEAN_NVIDIA_PMON", c.nvidia.pmon_fallback);
  if (c.nvidia.timeout_ms <= 0) c.nvidia.timeout_ms = Config{}.nvidia.timeout_ms;

  // --- [clear] ---
  c.clear.settle_ms = resolve_int(toml, have_toml, "clear", "settle_ms", "VRAMCLEAN_SETTLE_MS", c.clear.settle_ms);
  if (c.clear.settle_ms < 0) c.clear.settle_ms = 0;
  if (have_toml && toml.has("clear", "exclude")) c.clear.exclude = toml.get_int_list("clear", "exclude");
  else c.clear.exclude = env_int_list("VRAMCLEAN_EXCLUDE");

  // --- [log] ---
  c.log.verbose = resolve_bool(toml, have_toml, "log", "verbose", "VRAMCLEAN_VERBOSE", c.log.verbose);

  return c;
}

} // namespace vramclean::app
