#include "minitest.hpp"
#include "app/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

const char* kVars[] = {
  "VRAMCLEAN_NVIDIA_SMI_PATH", "VRAMCLEAN_SMI_TIMEOUT_MS", "VRAMCLEAN_NVIDIA_PMON",
  "VRAMCLEAN_SETTLE_MS", "VRAMCLEAN_EXCLUDE", "VRAMCLEAN_VERBOSE",
  "vramclean_NVIDIA_SMI_PATH", "vramclean_VERBOSE",
};

// Clears every config variable on entry and exit.
struct EnvScope {
  EnvScope() { clear(); }
  ~EnvScope() { clear(); }
  static void clear() { for (const char* v : kVars) ::unsetenv(v); }
};

std::string write_config(const char* suffix, const std::string& body) {
  auto path = std::filesystem::temp_directory_path() /
              ("vramclean_test_config_" + std::to_string(::getpid()) + "_" + suffix + ".toml");
  std::ofstream(path) << body;
  return path.string();
}

} // namespace

TEST(config_defaults_without_file) {
  EnvScope env;
  auto c = vramclean::app::load_config("/tmp/vramclean_test_config_missing.toml");
  ASSERT_EQ(c.nvidia.smi_path, "auto");
  ASSERT_EQ(c.nvidia.timeout_ms, 10000);
  ASSERT_EQ(c.nvidia.pmon_fallback, true);
  ASSERT_EQ(c.clear.settle_ms, 1000);
  ASSERT_TRUE(c.clear.exclude.empty());
  ASSERT_EQ(c.log.verbose, false);
}

TEST(config_reads_toml) {
  EnvScope env;
  auto path = write_config("toml",
    "[nvidia]\n"
    "smi_path = \"/opt/nvidia/bin/nvidia-smi\"\n"
    "timeout_ms = 3000\n"
    "pmon_fallback = false\n"
    "[clear]\n"
    "settle_ms = 250\n"
    "exclude = [1, 2]\n"
    "[log]\n"
    "verbose = true\n");
  auto c = vramclean::app::load_config(path);
  ASSERT_EQ(c.nvidia.smi_path, "/opt/nvidia/bin/nvidia-smi");
  ASSERT_EQ(c.nvidia.timeout_ms, 3000);
  ASSERT_EQ(c.nvidia.pmon_fallback, false);
  ASSERT_EQ(c.clear.settle_ms, 250);
  ASSERT_EQ(c.clear.exclude, (std::vector<int>{1, 2}));
  ASSERT_EQ(c.log.verbose, true);
  std::filesystem::remove(path);
}

TEST(config_toml_wins_over_env) {
  EnvScope env;
  ::setenv("VRAMCLEAN_SMI_TIMEOUT_MS", "42", 1);
  ::setenv("VRAMCLEAN_SETTLE_MS", "7", 1);
  auto path = write_config("precedence", "[nvidia]\ntimeout_ms = 5000\n");
  auto c = vramclean::app::load_config(path);
  ASSERT_EQ(c.nvidia.timeout_ms, 5000);
  ASSERT_EQ(c.clear.settle_ms, 7);
  std::filesystem::remove(path);
}

TEST(config_env_overrides_and_lowercase_prefix) {
  EnvScope env;
  ::setenv("vramclean_NVIDIA_SMI_PATH", "/usr/local/bin/nvidia-smi", 1);
  ::setenv("VRAMCLEAN_NVIDIA_PMON", "0", 1);
  ::setenv("VRAMCLEAN_EXCLUDE", "10, 20,bad,30", 1);
  ::setenv("VRAMCLEAN_VERBOSE", "yes", 1);
  auto c = vramclean::app::load_config("/tmp/vramclean_test_config_missing.toml");
  ASSERT_EQ(c.nvidia.smi_path, "/usr/local/bin/nvidia-smi");
  ASSERT_EQ(c.nvidia.pmon_fallback, false);
  ASSERT_EQ(c.clear.exclude, (std::vector<int>{10, 20, 30}));
  ASSERT_EQ(c.log.verbose, true);
}

TEST(config_rejects_nonsense_durations) {
  EnvScope env;
  ::setenv("VRAMCLEAN_SMI_TIMEOUT_MS", "-5", 1);
  ::setenv("VRAMCLEAN_SETTLE_MS", "-1", 1);
  auto c = vramclean::app::load_config("/tmp/vramclean_test_config_missing.toml");
  ASSERT_EQ(c.nvidia.timeout_ms, 10000);
  ASSERT_EQ(c.clear.settle_ms, 0);
}

TEST(config_file_path_prefers_xdg) {
  std::string old_xdg = std::getenv("XDG_CONFIG_HOME") ? std::getenv("XDG_CONFIG_HOME") : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(vramclean::app::config_file_path(), "/tmp/xdg/vramclean/config.toml");
  if (old_xdg.empty()) ::unsetenv("XDG_CONFIG_HOME"); else ::setenv("XDG_CONFIG_HOME", old_xdg.c_str(), 1);
}
