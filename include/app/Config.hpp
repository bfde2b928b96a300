#pragma once

#include <string>
#include <vector>

namespace vramclean::app {

struct Config {
  struct Nvidia {
    std::string smi_path{"auto"};   // "auto" searches PATH, then well-known locations
    int timeout_ms{10000};
    bool pmon_fallback{true};
  } nvidia;
  struct Clear {
    int settle_ms{1000};
    std::vector<int> exclude;       // PIDs protected on every run
  } clear;
  struct Log {
    bool verbose{false};
  } log;
};

// $XDG_CONFIG_HOME/vramclean/config.toml, else ~/.config/vramclean/config.toml.
// Empty when neither variable is set.
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default. An empty path uses
// config_file_path(); a missing file is not an error.
Config load_config(const std::string& path = {});

// Environment helpers accepting VRAMCLEAN_X and vramclean_X.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace vramclean::app
