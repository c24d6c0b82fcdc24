#include "patchgrade_harness/outcome_evaluator.hpp"
#include "patchgrade_harness/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using patchgrade::harness::TestOutcome;

int severity(TestOutcome outcome) noexcept {
    switch (outcome) {
        case TestOutcome::NotRun: return 0;
        case TestOutcome::Passed: return 1;
        case TestOutcome::Failed: return 2;
        case TestOutcome::Error: return 3;
    }
    return 3;
}

// A test reported more than once (reruns, duplicated ids) keeps its worst outcome.
void record(std::map<std::string, TestOutcome>& outcomes, const std::string& id, TestOutcome outcome) {
    auto [it, inserted] = outcomes.emplace(id, outcome);
    if (!inserted && severity(outcome) > severity(it->second)) {
        it->second = outcome;
    }
}

// String member, or its JSON text when the runner wrote something else (longrepr may be structured).
std::string text_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

bool all_whitespace(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

namespace patchgrade::harness {

bool CollectorFailure::import_failure() const {
    return longrepr.find("ImportError") != std::string::npos ||
           longrepr.find("ModuleNotFoundError") != std::string::npos;
}

TestOutcome map_runner_outcome(std::string_view outcome, const ReportOptions& options) noexcept {
    if (outcome == "passed") return TestOutcome::Passed;
    if (outcome == "skipped") {
        return options.skipped_ok ? TestOutcome::Passed : TestOutcome::Failed;
    }
    if (outcome == "failed" || outcome == "xfailed" || outcome == "xpassed") return TestOutcome::Failed;
    return TestOutcome::Error;
}

std::optional<StructuredReport> parse_structured_report(std::string_view text,
                                                        const ReportOptions& options,
                                                        std::string& diag) {
    if (all_whitespace(text)) {
        diag += "structured report is empty\n";
        return std::nullopt;
    }

    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        diag += std::string{"structured report is not valid JSON: "} + e.what() + "\n";
        return std::nullopt;
    }
    if (!doc.is_object()) {
        diag += "structured report is not a JSON object\n";
        return std::nullopt;
    }

    StructuredReport report;
    if (doc.contains("tests")) {
        const auto& tests = doc.at("tests");
        if (!tests.is_array()) {
            diag += "structured report: 'tests' is not an array\n";
            return std::nullopt;
        }
        for (const auto& test : tests) {
            if (!test.is_object() || !test.contains("nodeid") || !test.at("nodeid").is_string()) {
                diag += "structured report: skipping test entry without nodeid\n";
                continue;
            }
            const auto nodeid = test.at("nodeid").get<std::string>();
            const auto it = test.find("outcome");
            if (it == test.end() || !it->is_string()) {
                diag += "structured report: outcome of '" + nodeid + "' is missing or not a string\n";
                return std::nullopt;
            }
            record(report.outcomes, nodeid, map_runner_outcome(it->get<std::string>(), options));
        }
        if (const auto it = doc.find("collectors"); it != doc.end() && it->is_array()) {
            for (const auto& collector : *it) {
                if (!collector.is_object() || text_field(collector, "outcome") != "failed") {
                    continue;
                }
                report.collector_errors.push_back(
                    CollectorFailure{text_field(collector, "nodeid"), text_field(collector, "longrepr")});
            }
        }
        return report;
    }

    // Flat `{id: outcome}` object.
    for (const auto& item : doc.items()) {
        if (!item.value().is_string()) {
            diag += "structured report: outcome of '" + item.key() + "' is not a string\n";
            return std::nullopt;
        }
        record(report.outcomes, item.key(), map_runner_outcome(item.value().get<std::string>(), options));
    }
    return report;
}

RunResult make_error_result(const std::string& instance_id,
                            const ExpectedSets& expected,
                            ErrorKind kind,
                            TestOutcome fill,
                            std::string log_excerpt,
                            std::chrono::milliseconds elapsed) {
    RunResult result;
    result.instance_id = instance_id;
    for (const auto& id : expected.all()) {
        result.tests[id] = fill;
    }
    result.elapsed = elapsed;
    result.log_excerpt = std::move(log_excerpt);
    result.verdict = Verdict::Error;
    result.error = kind;
    return result;
}

OutcomeEvaluator::OutcomeEvaluator(Config config) : config_{std::move(config)} {}

RunResult OutcomeEvaluator::evaluate(const std::string& instance_id,
                                     const ExecutionResult& execution,
                                     const ExpectedSets& expected,
                                     Logger& log) const {
    return evaluate(instance_id, execution, expected, expected.all(), log);
}

RunResult OutcomeEvaluator::evaluate(const std::string& instance_id,
                                     const ExecutionResult& execution,
                                     const ExpectedSets& expected,
                                     const std::vector<std::string>& selected_tests,
                                     Logger& log) const {
    const std::string excerpt =
        tail_excerpt(execution.stdout_text + execution.stderr_text, config_.log_excerpt_bytes);

    std::string diag;
    std::optional<StructuredReport> report;
    if (execution.structured_report) {
        report = parse_structured_report(*execution.structured_report, config_.report, diag);
    } else {
        diag += "no structured report was produced\n";
    }
    if (!report) {
        log.error(instance_id + ": " + diag);
        return make_error_result(instance_id, expected, ErrorKind::MissingReport, TestOutcome::Error,
                                 diag + excerpt, execution.elapsed);
    }
    for (const auto& collector : report->collector_errors) {
        log.warning(instance_id + ": collection failed for '" + collector.nodeid + "'");
        if (!selected_tests.empty() && collector.import_failure()) {
            const std::string reason = "cannot import test module '" + collector.nodeid + "'\n" +
                                       tail_excerpt(collector.longrepr, config_.log_excerpt_bytes) + "\n";
            log.error(instance_id + ": " + reason);
            return make_error_result(instance_id, expected, ErrorKind::Collection, TestOutcome::Error,
                                     reason + excerpt, execution.elapsed);
        }
    }

    RunResult result;
    result.instance_id = instance_id;
    result.elapsed = execution.elapsed;
    result.log_excerpt = excerpt;
    result.error = ErrorKind::None;
    result.tests = report->outcomes;
    for (const auto& id : expected.all()) {
        result.tests.emplace(id, TestOutcome::NotRun);
    }

    const auto passed = [&](const std::string& id) { return result.tests.at(id) == TestOutcome::Passed; };
    const bool resolved = std::all_of(expected.fail_to_pass.begin(), expected.fail_to_pass.end(), passed) &&
                          std::all_of(expected.pass_to_pass.begin(), expected.pass_to_pass.end(), passed);
    result.verdict = resolved ? Verdict::Resolved : Verdict::Unresolved;

    for (const auto& id : expected.fail_to_fail) {
        if (passed(id) && std::find(result.stale_expectations.begin(), result.stale_expectations.end(), id) ==
                              result.stale_expectations.end()) {
            result.stale_expectations.push_back(id);
        }
    }
    if (!result.stale_expectations.empty()) {
        log.warning(instance_id + ": " + std::to_string(result.stale_expectations.size()) +
                    " FAIL_TO_FAIL test(s) now pass");
    }

    if (!resolved) {
        for (const auto& id : expected.fail_to_pass) {
            if (!passed(id)) log.info(instance_id + ": FAIL_TO_PASS " + id + " is " + std::string{to_string(result.tests.at(id))});
        }
        for (const auto& id : expected.pass_to_pass) {
            if (!passed(id)) log.info(instance_id + ": PASS_TO_PASS " + id + " is " + std::string{to_string(result.tests.at(id))});
        }
    }
    return result;
}

}  // namespace patchgrade::harness
