#pragma once

#include <stdexcept>
#include <string>

namespace vramclean::app {

// The diagnostic binary could not be located or executed.
struct ToolNotFoundError : public std::runtime_error { using std::runtime_error::runtime_error; };

// The tool ran but its output yielded no usable records.
struct ParseError : public std::runtime_error { using std::runtime_error::runtime_error; };

// The tool started but timed out or exited with a failure status.
struct ToolExecutionError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Invalid command line input.
struct UsageError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Process exit codes reported by main().
enum class ExitCode : int {
  Ok = 0,
  Usage = 1,
  ToolNotFound = 2,
  Parse = 3,
  ToolFailed = 4,
};

} // namespace vramclean::app
