#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "build_pipeline.hpp"
#include "execution_engine.hpp"
#include "logger.hpp"
#include "outcome_evaluator.hpp"
#include "scheduler.hpp"
#include "spec_resolver.hpp"

namespace patchgrade::harness {

/**
 * \brief Evaluates one instance: resolve, build, execute, evaluate.
 *
 * The test patch is applied before the candidate patch. Every failure is
 * converted into an ERROR RunResult carrying the matching error kind, so
 * nothing escapes run(). Per-instance artifacts land in
 * `<artifact_root>/<log_dir_name>/<instance id>/`:
 *   - `run_instance.log`
 *   - `patch_<n>.diff` for each non-empty patch
 *   - `test_stdout.txt`, `test_stderr.txt`
 *   - `report.json` when the test runner produced one
 */
class EvaluationHarness : public InstanceRunner {
public:
    struct Config {
        std::filesystem::path artifact_root{"logs"};
        std::string log_dir_name{"evaluate_logs"};
        std::size_t log_excerpt_bytes{16 * 1024};
        std::ostream* console{nullptr};
        LogLevel console_level{LogLevel::Warning};
        std::vector<std::string> container_env{};
    };

    EvaluationHarness(const SpecResolver& resolver,
                      BuildPipeline& pipeline,
                      ExecutionEngine& engine,
                      const OutcomeEvaluator& evaluator,
                      Config config,
                      Logger& run_log = Logger::null());

    RunResult run(const InstanceJob& job, std::chrono::seconds timeout) override;

    /// Directory holding the artifacts of `instance_id`.
    [[nodiscard]] std::filesystem::path instance_dir(const std::string& instance_id) const;

private:
    const SpecResolver& resolver_;
    BuildPipeline& pipeline_;
    ExecutionEngine& engine_;
    const OutcomeEvaluator& evaluator_;
    Config config_;
    Logger& run_log_;
    std::atomic<std::size_t> container_seq_{0};
};

/// Instance id reduced to characters safe in container names and file names.
[[nodiscard]] std::string sanitize_name(const std::string& raw);

}  // namespace patchgrade::harness
