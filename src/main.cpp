#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Errors.hpp"
#include "app/MemoryClearer.hpp"
#include "app/Runner.hpp"
#include "util/CommandRunner.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>

using namespace vramclean;

int main(int argc, char** argv) {
  app::CliOptions opt;
  try {
    opt = app::parse_cli(argc, argv);
  } catch (const app::UsageError& e) {
    std::fprintf(stderr, "vramclean: %s\n\n%s", e.what(), app::usage_text().c_str());
    return static_cast<int>(app::ExitCode::Usage);
  }
  if (opt.help) {
    std::cout << app::usage_text();
    return static_cast<int>(app::ExitCode::Ok);
  }

  app::Config cfg = app::load_config(opt.config_path);
  util::Log log(cfg.log.verbose || opt.verbose);
  if (!opt.config_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(opt.config_path, ec))
      log.warn("config", "%s not found, using defaults", opt.config_path.c_str());
  }

  util::SubprocessRunner runner;
  app::KillSignalSender sender;
  return app::run_commands(opt, cfg, runner, sender, log, std::cout);
}
