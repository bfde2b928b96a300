#include "minitest.hpp"
#include "ui/Formatting.hpp"

using namespace vramclean;

TEST(format_gpu_block_lines) {
  std::vector<model::GpuRecord> gpus(1);
  gpus[0].id = 0;
  gpus[0].used_mb = 1024;
  gpus[0].total_mb = 8192;
  auto out = ui::format_gpu_block(gpus);
  ASSERT_EQ(out, "=== GPU Memory Status ===\nGPU 0: 1024MB / 8192MB (12.5% used, 7168MB free)\n");
  gpus[0].name = "NVIDIA A100";
  ASSERT_TRUE(ui::format_gpu_block(gpus).find("free)  NVIDIA A100\n") != std::string::npos);
}

TEST(format_process_block_empty_and_rows) {
  ASSERT_EQ(ui::format_process_block({}), "=== GPU Processes ===\nNo GPU processes found\n");
  std::vector<model::ProcessRecord> procs = {{.pid=1234, .gpu_id=0, .memory_mb=512, .command="python"}};
  ASSERT_EQ(ui::format_process_block(procs),
            "=== GPU Processes ===\nPID: 1234     GPU: 0   Memory: 512MB    Command: python\n");
}

TEST(format_process_block_truncates_long_commands) {
  std::string longcmd(80, 'x');
  std::vector<model::ProcessRecord> procs = {{.pid=1, .gpu_id=0, .memory_mb=1, .command=longcmd}};
  auto out = ui::format_process_block(procs);
  ASSERT_TRUE(out.find(std::string(47, 'x') + "~\n") != std::string::npos);
  ASSERT_TRUE(out.find(std::string(48, 'x')) == std::string::npos);
}

TEST(format_dry_run_lists_candidates) {
  app::ClearResult r;
  r.skipped_dry_run = true;
  r.candidates = {{.pid=111, .gpu_id=0, .memory_mb=512, .command="a"}, {.pid=333, .gpu_id=0, .memory_mb=1, .command=""}};
  auto out = ui::format_dry_run(r);
  ASSERT_EQ(out,
    "DRY RUN: Would terminate 2 processes:\n"
    "  PID: 111, GPU: 0, Command: a\n"
    "  PID: 333, GPU: 0, Command: N/A\n"
    "\nDry run complete. Found 2 processes to terminate.\n");
}

TEST(format_clear_result_in_attempt_order) {
  app::ClearResult r;
  r.candidates = {{.pid=1}, {.pid=2}, {.pid=3}};
  r.attempted = {1, 2, 3};
  r.succeeded = {1, 3};
  r.failed = {{2, "permission denied"}};
  auto out = ui::format_clear_result(r, true);
  ASSERT_EQ(out,
    "Sent SIGKILL to PID 1\n"
    "Failed to terminate PID 2: permission denied\n"
    "Sent SIGKILL to PID 3\n"
    "\nCleared 2/3 GPU processes.\n");
}

TEST(format_width_helpers_count_utf8) {
  ASSERT_EQ(ui::display_cols("abc"), 3);
  ASSERT_EQ(ui::display_cols("\xC3\xA9t\xC3\xA9"), 3);
  ASSERT_EQ(ui::take_cols("\xC3\xA9t\xC3\xA9", 2), "\xC3\xA9t");
  ASSERT_EQ(ui::trunc_pad("ab", 4), "ab  ");
  ASSERT_EQ(ui::trunc_pad("abcdef", 4), "abc~");
}
