#include "patchgrade_harness/scheduler.hpp"
#include "patchgrade_harness/outcome_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace {

using patchgrade::harness::FailFastPolicy;
using patchgrade::harness::Verdict;

bool triggers_fail_fast(FailFastPolicy policy, Verdict verdict) noexcept {
    switch (policy) {
        case FailFastPolicy::Off: return false;
        case FailFastPolicy::OnError: return verdict == Verdict::Error;
        case FailFastPolicy::OnUnresolved: return verdict != Verdict::Resolved;
    }
    return false;
}

}  // namespace

namespace patchgrade::harness {

Scheduler::Scheduler(InstanceRunner& runner, Logger& log) : runner_{runner}, log_{log} {}

void Scheduler::cancel() noexcept {
    cancelled_.store(true);
}

std::vector<RunResult> Scheduler::run_all(const std::vector<InstanceJob>& jobs,
                                          const SchedulerOptions& options,
                                          const ResultCallback& on_result) {
    using Clock = std::chrono::steady_clock;

    cancelled_.store(false);
    not_dispatched_.store(0);

    std::vector<RunResult> results;
    results.reserve(jobs.size());
    if (jobs.empty()) {
        return results;
    }

    const auto deadline = options.global_timeout
                              ? std::optional<Clock::time_point>{Clock::now() + *options.global_timeout}
                              : std::nullopt;

    std::mutex mutex;
    std::size_t next = 0;
    std::size_t dispatched = 0;
    bool stop = false;

    auto worker = [&] {
        for (;;) {
            std::size_t index = 0;
            {
                std::lock_guard<std::mutex> guard(mutex);
                if (!stop && cancelled_.load()) {
                    stop = true;
                    log_.warning("run cancelled, no further instances will be dispatched");
                }
                if (!stop && deadline && Clock::now() >= *deadline) {
                    stop = true;
                    log_.warning("global timeout reached, no further instances will be dispatched");
                }
                if (stop || next >= jobs.size()) {
                    return;
                }
                index = next++;
                ++dispatched;
            }

            const auto& job = jobs[index];
            const auto timeout = job.instance.timeout.value_or(options.per_instance_timeout);
            RunResult result;
            try {
                result = runner_.run(job, timeout);
            } catch (const std::exception& e) {
                log_.error(job.instance.id + ": unhandled error: " + e.what());
                result = make_error_result(job.instance.id, job.instance.expected, ErrorKind::Internal,
                                           TestOutcome::Error, e.what());
            }

            std::lock_guard<std::mutex> guard(mutex);
            log_.info(job.instance.id + ": " + std::string{to_string(result.verdict)});
            if (on_result) {
                try {
                    on_result(result);
                } catch (const std::exception& e) {
                    log_.error(job.instance.id + ": result callback failed: " + e.what());
                }
            }
            if (!stop && triggers_fail_fast(options.fail_fast, result.verdict)) {
                stop = true;
                log_.warning("fail-fast triggered by " + job.instance.id + " (" +
                             std::string{to_string(result.verdict)} + ")");
            }
            results.push_back(std::move(result));
        }
    };

    const std::size_t worker_count = std::clamp<std::size_t>(options.max_workers, 1, jobs.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    not_dispatched_.store(jobs.size() - dispatched);
    if (dispatched < jobs.size()) {
        log_.warning(std::to_string(jobs.size() - dispatched) + " instance(s) were not dispatched");
    }
    return results;
}

}  // namespace patchgrade::harness
