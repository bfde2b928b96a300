#pragma once
#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/MemoryClearer.hpp"
#include "util/CommandRunner.hpp"
#include "util/Log.hpp"

#include <ostream>

namespace vramclean::app {

// Status query, optional clear and post-clear refresh for one invocation.
// Report text goes to out, diagnostics to log. Returns an ExitCode value;
// tool failures before any signal is sent map to their exit codes, a
// failed refresh after a clear only warns.
[[nodiscard]] int run_commands(const CliOptions& opt, const Config& cfg,
                               const util::ICommandRunner& runner, SignalSender& sender,
                               const util::Log& log, std::ostream& out);

} // namespace vramclean::app
