#include "app/Runner.hpp"
#include "app/Errors.hpp"
#include "collectors/GpuStatusReader.hpp"
#include "ui/Formatting.hpp"

#include <chrono>

namespace vramclean::app {

static int code(ExitCode c) { return static_cast<int>(c); }

static int execute(const CliOptions& opt, const Config& cfg, const collectors::GpuStatusReader& reader,
                   SignalSender& sender, const util::Log& log, std::ostream& out) {
  model::GpuStatus st = reader.query_status();
  if (opt.status) out << ui::format_status(st);
  if (!opt.clear) return code(ExitCode::Ok);

  ClearOptions co;
  co.gpu_filter = opt.gpus;
  co.exclude = opt.exclude;
  co.exclude.insert(cfg.clear.exclude.begin(), cfg.clear.exclude.end());
  co.force = opt.force;
  co.dry_run = opt.dry_run;

  MemoryClearer clearer(sender, log);
  auto r = clearer.clear(st.processes, co);
  if (opt.status) out << '\n';
  if (r.skipped_dry_run) {
    out << ui::format_dry_run(r);
    return code(ExitCode::Ok);
  }
  out << ui::format_clear_result(r, opt.force);
  if (r.succeeded.empty()) return code(ExitCode::Ok);

  auto alive = await_exit(r.succeeded, std::chrono::milliseconds(cfg.clear.settle_ms));
  for (int pid : alive) log.debug("clear", "PID %d still running after %dms", pid, cfg.clear.settle_ms);

  // Signals are already delivered; a failed refresh does not change the outcome.
  try {
    auto fresh = reader.query_status();
    out << "\nUpdated GPU status:\n" << ui::format_status(fresh);
  } catch (const ToolNotFoundError& e) {
    log.warn("status", "could not refresh GPU status: %s", e.what());
  } catch (const ParseError& e) {
    log.warn("status", "could not refresh GPU status: %s", e.what());
  } catch (const ToolExecutionError& e) {
    log.warn("status", "could not refresh GPU status: %s", e.what());
  }
  return code(ExitCode::Ok);
}

int run_commands(const CliOptions& opt, const Config& cfg, const util::ICommandRunner& runner,
                 SignalSender& sender, const util::Log& log, std::ostream& out) {
  collectors::GpuStatusReader reader(cfg, runner, log);
  try {
    return execute(opt, cfg, reader, sender, log, out);
  } catch (const ToolNotFoundError& e) {
    log.error("", "%s", e.what());
    return code(ExitCode::ToolNotFound);
  } catch (const ParseError& e) {
    log.error("", "%s", e.what());
    return code(ExitCode::Parse);
  } catch (const ToolExecutionError& e) {
    log.error("", "%s", e.what());
    return code(ExitCode::ToolFailed);
  }
}

} // namespace vramclean::app
