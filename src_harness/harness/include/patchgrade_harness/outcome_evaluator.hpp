#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execution_engine.hpp"
#include "logger.hpp"
#include "model.hpp"

namespace patchgrade::harness {

/// A test module (or package) the runner could not collect.
struct CollectorFailure {
    std::string nodeid;
    std::string longrepr;   ///< Runner's error text, traceback included

    /// The module failed to import (ImportError / ModuleNotFoundError).
    [[nodiscard]] bool import_failure() const;
};

struct StructuredReport {
    std::map<std::string, TestOutcome> outcomes;
    std::vector<CollectorFailure> collector_errors;
};

struct ReportOptions {
    bool skipped_ok{true};   ///< skipped counts as passed; xfailed never does
};

/**
 * \brief Parses a test runner report.
 *
 * Accepts the pytest-json-report layout (`tests[].nodeid`, `tests[].outcome`,
 * `collectors[]`) and a flat `{"<test id>": "<outcome>"}` object. Returns
 * nullopt, with the reason appended to `diag`, for empty or malformed input.
 */
[[nodiscard]] std::optional<StructuredReport> parse_structured_report(std::string_view text,
                                                                      const ReportOptions& options,
                                                                      std::string& diag);

/// Maps a runner outcome string (`passed`, `skipped`, `failed`, `xfailed`, `xpassed`, `error`, ...).
[[nodiscard]] TestOutcome map_runner_outcome(std::string_view outcome, const ReportOptions& options) noexcept;

/// RunResult for an instance that never produced usable results: every expected test gets `fill`.
[[nodiscard]] RunResult make_error_result(const std::string& instance_id,
                                          const ExpectedSets& expected,
                                          ErrorKind kind,
                                          TestOutcome fill,
                                          std::string log_excerpt,
                                          std::chrono::milliseconds elapsed = std::chrono::milliseconds{0});

/**
 * \brief Compares an execution result with the expected transition sets.
 *
 * RESOLVED iff every FAIL_TO_PASS and every PASS_TO_PASS test passed.
 * FAIL_TO_FAIL never changes the verdict; ids from it that passed are
 * reported as stale expectations. A missing or unparseable report yields
 * ERROR with every expected test marked `error`. So does a test module that
 * failed to import while tests were selected: the environment is broken,
 * whatever the patch does.
 */
class OutcomeEvaluator {
public:
    struct Config {
        ReportOptions report{};
        std::size_t log_excerpt_bytes{16 * 1024};
    };

    OutcomeEvaluator() = default;
    explicit OutcomeEvaluator(Config config);

    /// Expected ids are the selected tests.
    [[nodiscard]] RunResult evaluate(const std::string& instance_id,
                                     const ExecutionResult& execution,
                                     const ExpectedSets& expected,
                                     Logger& log = Logger::null()) const;

    /// `selected_tests` is what the test command was asked to run (test files in produce mode).
    [[nodiscard]] RunResult evaluate(const std::string& instance_id,
                                     const ExecutionResult& execution,
                                     const ExpectedSets& expected,
                                     const std::vector<std::string>& selected_tests,
                                     Logger& log = Logger::null()) const;

private:
    Config config_{};
};

}  // namespace patchgrade::harness
