#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return "/tmp/vramclean_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/vramclean_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_sections) {
  auto path = tmp_path("basic");
  write_file(path,
    "[nvidia]\n"
    "smi_path = \"/usr/bin/nvidia-smi\"\n"
    "timeout_ms = 2500\n"
    "pmon_fallback = false\n"
    "\n"
    "[clear]\n"
    "settle_ms = 0\n"
  );
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("nvidia", "smi_path"), "/usr/bin/nvidia-smi");
  ASSERT_EQ(tr.get_int("nvidia", "timeout_ms"), 2500);
  ASSERT_EQ(tr.get_bool("nvidia", "pmon_fallback", true), false);
  ASSERT_EQ(tr.get_int("clear", "settle_ms", 99), 0);
  ASSERT_TRUE(tr.has("clear", "settle_ms"));
  ASSERT_TRUE(!tr.has("clear", "exclude"));
  ASSERT_TRUE(!tr.has("log", "verbose"));
  remove_file(path);
}

TEST(toml_defaults_for_missing_or_bad_values) {
  auto path = tmp_path("defaults");
  write_file(path, "[n]\nstr = hello\npartial = 12abc\nflag = maybe\n");
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_EQ(tr.get_int("n", "partial", 7), 7);
  ASSERT_EQ(tr.get_bool("n", "flag", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("n", "missing", -1), -1);
  remove_file(path);
}

TEST(toml_trailing_comments) {
  auto path = tmp_path("comments");
  write_file(path,
    "# protected pids\n"
    "[ clear ]   # section comment\n"
    "  settle_ms  =  500   # ms\n"
    "  label = \"gpu #0\"  # quoted hash survives\n"
  );
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("clear", "settle_ms"), 500);
  ASSERT_EQ(tr.get_string("clear", "label"), "gpu #0");
  remove_file(path);
}

TEST(toml_int_list) {
  auto path = tmp_path("list");
  write_file(path,
    "[clear]\n"
    "exclude = [1234, 5678 ,  42]\n"
    "bare = 7,8\n"
    "mixed = [1, x, 3]\n"
    "empty = []\n"
  );
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int_list("clear", "exclude"), (std::vector<int>{1234, 5678, 42}));
  ASSERT_EQ(tr.get_int_list("clear", "bare"), (std::vector<int>{7, 8}));
  ASSERT_EQ(tr.get_int_list("clear", "mixed"), (std::vector<int>{1, 3}));
  ASSERT_TRUE(tr.get_int_list("clear", "empty").empty());
  ASSERT_TRUE(tr.get_int_list("clear", "missing").empty());
  remove_file(path);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  vramclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  // Keys before any [section] go under empty-string section
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
  remove_file(path);
}
