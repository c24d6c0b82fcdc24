#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace patchgrade::harness {

struct ProcessOptions {
    std::string stdin_data{};
    std::optional<std::chrono::milliseconds> timeout{};
    std::size_t max_output_bytes{256 * 1024};  ///< Per stream; the tail is kept
};

struct ProcessResult {
    int exit_code{-1};          ///< Exit status, or 128 + signal number
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out{false};
    bool truncated{false};
};

/**
 * \brief Runs `argv` (PATH lookup on argv[0]) and captures its output.
 *
 * stdin is fed from `stdin_data` then closed. On timeout the child receives
 * SIGKILL and whatever was captured so far is returned with `timed_out` set.
 * Throws std::runtime_error when the process cannot be spawned at all; a
 * missing executable is reported as exit code 127.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

/// Keeps the last `limit` bytes of `text`, prefixed by a truncation marker.
[[nodiscard]] std::string tail_excerpt(const std::string& text, std::size_t limit);

}  // namespace patchgrade::harness
