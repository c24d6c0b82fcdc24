#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"
#include "model.hpp"

namespace patchgrade::harness {

struct InstanceJob {
    Instance instance;
    EnvironmentSpec environment;
    std::optional<std::vector<std::string>> test_selection{};   ///< Overrides the expected ids
};

/**
 * \brief Evaluates one instance end to end.
 *
 * Implementations turn every failure into an ERROR RunResult; an exception
 * escaping run() is still contained by the scheduler and reported as an
 * internal error for that instance only.
 */
class InstanceRunner {
public:
    virtual ~InstanceRunner() = default;

    virtual RunResult run(const InstanceJob& job, std::chrono::seconds timeout) = 0;
};

enum class FailFastPolicy { Off, OnError, OnUnresolved };

struct SchedulerOptions {
    std::size_t max_workers{1};
    std::chrono::seconds per_instance_timeout{std::chrono::minutes(30)};
    FailFastPolicy fail_fast{FailFastPolicy::Off};
    std::optional<std::chrono::seconds> global_timeout{};
};

/**
 * \brief Bounded worker pool over a list of instance jobs.
 *
 * At most `max_workers` instances are in flight. Fail-fast, the global
 * deadline and cancel() only stop dispatch: instances already running finish
 * (or time out) and their results are kept. Jobs that were never dispatched
 * produce no RunResult.
 */
class Scheduler {
public:
    using ResultCallback = std::function<void(const RunResult&)>;

    explicit Scheduler(InstanceRunner& runner, Logger& log = Logger::null());

    /// Results in completion order; `on_result` sees each one as soon as it is available.
    std::vector<RunResult> run_all(const std::vector<InstanceJob>& jobs,
                                   const SchedulerOptions& options,
                                   const ResultCallback& on_result = {});

    /// Stops dispatch of the current run. Safe to call from any thread.
    void cancel() noexcept;

    /// Jobs of the last run that were never dispatched.
    [[nodiscard]] std::size_t not_dispatched() const noexcept { return not_dispatched_.load(); }

private:
    InstanceRunner& runner_;
    Logger& log_;
    std::atomic<bool> cancelled_{false};
    std::atomic<std::size_t> not_dispatched_{0};
};

}  // namespace patchgrade::harness
