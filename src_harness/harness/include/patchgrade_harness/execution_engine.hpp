#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "container_runtime.hpp"
#include "logger.hpp"

namespace patchgrade::harness {

/**
 * \brief Lifecycle of an execution container.
 *
 * Created → Patching → Running → {Completed | TimedOut | PatchFailed | InternalError} → TornDown.
 * Patching may also end in TimedOut; every non-terminal state may end in InternalError.
 */
enum class ContainerState { Created, Patching, Running, Completed, TimedOut, PatchFailed, InternalError, TornDown };

[[nodiscard]] std::string_view to_string(ContainerState state) noexcept;

struct ExecutionRequest {
    std::string image;
    std::vector<std::string> patches;   ///< Applied in order; empty entries are skipped
    std::string test_command;
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    std::string report_path{"/harness/report.json"};
    std::vector<std::string> env;
    std::string container_name;
};

struct ExecutionResult {
    int exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> structured_report{};
    ContainerState final_state{ContainerState::Created};
    std::chrono::milliseconds elapsed{0};
    std::string patch_log;   ///< Output of the patch application commands
};

/**
 * \brief Scoped owner of one execution container.
 *
 * Tracks the container state and tears the container down exactly once: on
 * teardown() or, at the latest, on destruction. Out-of-order transitions throw
 * InternalError.
 */
class ContainerSession {
public:
    using Listener = std::function<void(const std::string& container, ContainerState state)>;

    ContainerSession(ContainerRuntime& runtime, std::string container, Listener listener, Logger& log);
    ~ContainerSession();

    ContainerSession(const ContainerSession&) = delete;
    ContainerSession& operator=(const ContainerSession&) = delete;

    void transition(ContainerState next);

    /// Moves to InternalError unless a terminal state was already reached.
    void fail() noexcept;

    /// Kills the container; errors are logged.
    void kill() noexcept;

    /// Removes the container and enters TornDown. Idempotent.
    void teardown() noexcept;

    [[nodiscard]] ContainerState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& id() const noexcept { return container_; }

private:
    void notify(ContainerState state) noexcept;

    ContainerRuntime& runtime_;
    std::string container_;
    Listener listener_;
    Logger& log_;
    ContainerState state_{ContainerState::Created};
};

/**
 * \brief Runs a test command against a patched copy of an image.
 *
 * Throws PatchApplyError when a patch does not apply, TimeoutError when the
 * wall-clock budget of the whole request is exhausted (the container is killed
 * first), and InternalError when the runtime fails. The container is removed
 * on every path.
 */
class ExecutionEngine {
public:
    struct Config {
        std::string working_dir{"/workspace"};
        std::string patch_dir{"/harness/patches"};
        std::size_t max_output_bytes{512 * 1024};
        std::size_t log_excerpt_bytes{16 * 1024};
        ContainerSession::Listener listener{};
    };

    explicit ExecutionEngine(ContainerRuntime& runtime);
    ExecutionEngine(ContainerRuntime& runtime, Config config, Logger& log = Logger::null());

    ExecutionResult run(const ExecutionRequest& request);
    ExecutionResult run(const ExecutionRequest& request, Logger& log);

private:
    ContainerRuntime& runtime_;
    Config config_;
    Logger& log_;
};

}  // namespace patchgrade::harness
