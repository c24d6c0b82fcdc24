#include "patchgrade_harness/execution_engine.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/spec_resolver.hpp"
#include "patchgrade_harness/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace {

using Clock = std::chrono::steady_clock;
using patchgrade::harness::ContainerState;

bool is_terminal(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Completed:
        case ContainerState::TimedOut:
        case ContainerState::PatchFailed:
        case ContainerState::InternalError:
            return true;
        default:
            return false;
    }
}

bool allowed(ContainerState from, ContainerState to) noexcept {
    if (from == ContainerState::TornDown) return false;
    if (to == ContainerState::TornDown) return true;
    if (to == ContainerState::InternalError) return !is_terminal(from);
    switch (from) {
        case ContainerState::Created:
            return to == ContainerState::Patching;
        case ContainerState::Patching:
            return to == ContainerState::Running || to == ContainerState::PatchFailed ||
                   to == ContainerState::TimedOut;
        case ContainerState::Running:
            return to == ContainerState::Completed || to == ContainerState::TimedOut;
        default:
            return false;
    }
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

namespace patchgrade::harness {

std::string_view to_string(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Created: return "CREATED";
        case ContainerState::Patching: return "PATCHING";
        case ContainerState::Running: return "RUNNING";
        case ContainerState::Completed: return "COMPLETED";
        case ContainerState::TimedOut: return "TIMED_OUT";
        case ContainerState::PatchFailed: return "PATCH_FAILED";
        case ContainerState::InternalError: return "INTERNAL_ERROR";
        case ContainerState::TornDown: return "TORN_DOWN";
    }
    return "UNKNOWN";
}

// ContainerSession

ContainerSession::ContainerSession(ContainerRuntime& runtime, std::string container, Listener listener, Logger& log)
    : runtime_{runtime}, container_{std::move(container)}, listener_{std::move(listener)}, log_{log} {
    notify(state_);
}

ContainerSession::~ContainerSession() {
    teardown();
}

void ContainerSession::transition(ContainerState next) {
    if (!allowed(state_, next)) {
        throw InternalError("container " + container_ + ": invalid state transition " +
                            std::string{to_string(state_)} + " -> " + std::string{to_string(next)});
    }
    if (next == ContainerState::TornDown) {
        teardown();
        return;
    }
    state_ = next;
    notify(state_);
}

void ContainerSession::fail() noexcept {
    if (state_ != ContainerState::TornDown && !is_terminal(state_)) {
        state_ = ContainerState::InternalError;
        notify(state_);
    }
}

void ContainerSession::kill() noexcept {
    try {
        runtime_.kill(container_);
    } catch (const std::exception& e) {
        log_.warning("failed to kill container " + container_ + ": " + e.what());
    }
}

void ContainerSession::teardown() noexcept {
    if (state_ == ContainerState::TornDown) {
        return;
    }
    try {
        runtime_.remove(container_);
    } catch (const std::exception& e) {
        log_.warning("failed to remove container " + container_ + ": " + e.what());
    }
    log_.debug("container " + container_ + " torn down after " + std::string{to_string(state_)});
    state_ = ContainerState::TornDown;
    notify(state_);
}

void ContainerSession::notify(ContainerState state) noexcept {
    if (!listener_) {
        return;
    }
    try {
        listener_(container_, state);
    } catch (const std::exception& e) {
        log_.warning(std::string{"container state listener failed: "} + e.what());
    }
}

// ExecutionEngine

ExecutionEngine::ExecutionEngine(ContainerRuntime& runtime) : ExecutionEngine(runtime, Config{}) {}

ExecutionEngine::ExecutionEngine(ContainerRuntime& runtime, Config config, Logger& log)
    : runtime_{runtime}, config_{std::move(config)}, log_{log} {}

ExecutionResult ExecutionEngine::run(const ExecutionRequest& request) {
    return run(request, log_);
}

ExecutionResult ExecutionEngine::run(const ExecutionRequest& request, Logger& log) {
    const auto started = Clock::now();
    const auto deadline = started + request.timeout;

    ContainerOptions options;
    options.image = request.image;
    options.name = request.container_name;
    options.network_disabled = true;
    options.working_dir = config_.working_dir;
    options.env = request.env;

    ContainerSession session(runtime_, runtime_.create_container(options), config_.listener, log);
    log.info("execution container " + session.id() + " started from " + request.image);

    ExecutionResult result;
    auto timed_out = [&](const std::string& partial_stdout, const std::string& partial_stderr) {
        session.transition(ContainerState::TimedOut);
        session.kill();
        log.error("execution exceeded " + std::to_string(request.timeout.count()) + " ms, container killed");
        return TimeoutError(request.timeout,
                            tail_excerpt(partial_stdout, config_.log_excerpt_bytes),
                            tail_excerpt(partial_stderr, config_.log_excerpt_bytes));
    };

    try {
        session.transition(ContainerState::Patching);
        for (std::size_t i = 0; i < request.patches.size(); ++i) {
            const auto& patch = request.patches[i];
            if (blank(patch)) {
                continue;
            }
            const std::string path = config_.patch_dir + "/patch_" + std::to_string(i) + ".diff";
            runtime_.write_file(session.id(), path, patch);

            const std::string quoted = shell_quote(path);
            const std::string command = "cd " + shell_quote(config_.working_dir) + " && (git apply --verbose " +
                                        quoted + " || patch --batch --fuzz=5 -p1 -i " + quoted + ")";
            const auto budget = remaining(deadline);
            if (budget.count() == 0) {
                throw timed_out(result.patch_log, {});
            }
            const auto applied = runtime_.exec(session.id(), command, budget);
            result.patch_log += applied.stdout_text;
            result.patch_log += applied.stderr_text;
            if (applied.timed_out) {
                throw timed_out(result.patch_log, {});
            }
            if (applied.exit_code != 0) {
                session.transition(ContainerState::PatchFailed);
                const auto excerpt = tail_excerpt(applied.stdout_text + applied.stderr_text, config_.log_excerpt_bytes);
                log.error("patch " + std::to_string(i) + " failed to apply (exit code " +
                          std::to_string(applied.exit_code) + ")\n" + excerpt);
                throw PatchApplyError(i, applied.exit_code, excerpt);
            }
            log.info("patch " + std::to_string(i) + " applied");
        }

        session.transition(ContainerState::Running);
        const auto budget = remaining(deadline);
        if (budget.count() == 0) {
            throw timed_out({}, {});
        }
        auto executed = runtime_.exec(session.id(), request.test_command, budget);
        if (executed.timed_out) {
            throw timed_out(executed.stdout_text, executed.stderr_text);
        }

        result.exit_code = executed.exit_code;
        result.stdout_text = tail_excerpt(executed.stdout_text, config_.max_output_bytes);
        result.stderr_text = tail_excerpt(executed.stderr_text, config_.max_output_bytes);
        result.structured_report = runtime_.read_file(session.id(), request.report_path);
        if (!result.structured_report) {
            log.warning("no structured report at " + request.report_path);
        }
        session.transition(ContainerState::Completed);
    } catch (const std::exception&) {
        session.fail();
        throw;
    }

    result.final_state = session.state();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    log.info("tests finished with exit code " + std::to_string(result.exit_code) + " in " +
             std::to_string(result.elapsed.count()) + " ms");
    return result;
}

}  // namespace patchgrade::harness
