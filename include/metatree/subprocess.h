#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

struct ProcessOptions {
  // Zero disables the timeout.
  std::chrono::milliseconds timeout{0};
  // Time between SIGTERM and SIGKILL once the process has to go.
  std::chrono::milliseconds grace{2000};
  std::optional<std::filesystem::path> working_directory;
  // Treated like an expired timeout once it reads true.
  const std::atomic<bool> *stop_requested = nullptr;
};

struct ProcessResult {
  // Exit status, or -1 if the process was ended by a signal.
  int exit_code = -1;
  int term_signal = 0;
  bool timed_out = false;
  bool stopped = false;
  std::string standard_output;
  std::string standard_error;

  bool Succeeded() const {
    return exit_code == 0 && !timed_out && !stopped;
  }
};

// Runs argv[0] (looked up in PATH) with stdin from /dev/null, capturing
// stdout and stderr. Throws std::system_error if the process cannot be
// started.
ProcessResult RunProcess(const std::vector<std::string> &argv,
                         const ProcessOptions &options = {});

} // namespace metatree
