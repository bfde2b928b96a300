// /proc helpers with optional root remap for tests
#pragma once
#include <optional>
#include <string>

namespace vramclean::util {

// Map an absolute /proc path to an alternate root if VRAMCLEAN_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// True while /proc/<pid> exists and the task is not a zombie.
auto pid_alive(int pid) -> bool;

// Short command name from /proc/<pid>/comm, without the trailing newline.
auto read_comm(int pid) -> std::optional<std::string>;

} // namespace vramclean::util
