#include <catch2/catch.hpp>

#include "patchgrade_harness/outcome_evaluator.hpp"

#include <string>
#include <vector>

using namespace patchgrade::harness;

namespace {

ExpectedSets expected_sets() {
    ExpectedSets e;
    e.fail_to_pass = {"t1"};
    e.pass_to_pass = {"t2"};
    return e;
}

ExecutionResult execution_with(const std::string& report) {
    ExecutionResult r;
    r.exit_code = 0;
    r.stdout_text = "3 passed\n";
    r.structured_report = report;
    r.final_state = ContainerState::Completed;
    r.elapsed = std::chrono::milliseconds(1500);
    return r;
}

}  // namespace

TEST_CASE("Verdict follows FAIL_TO_PASS and PASS_TO_PASS", "[evaluator]") {
    const OutcomeEvaluator evaluator;

    SECTION("all expected tests pass, extra failures do not matter") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"passed","t2":"passed","t3":"failed"})"),
                                          expected_sets());
        REQUIRE(r.verdict == Verdict::Resolved);
        REQUIRE(r.error == ErrorKind::None);
        REQUIRE(r.tests.at("t3") == TestOutcome::Failed);
        REQUIRE(r.elapsed == std::chrono::milliseconds(1500));
    }

    SECTION("a FAIL_TO_PASS test still failing") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"failed","t2":"passed"})"), expected_sets());
        REQUIRE(r.verdict == Verdict::Unresolved);
    }

    SECTION("a PASS_TO_PASS test that broke") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"passed","t2":"error"})"), expected_sets());
        REQUIRE(r.verdict == Verdict::Unresolved);
    }

    SECTION("an expected test missing from the report") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"passed"})"), expected_sets());
        REQUIRE(r.verdict == Verdict::Unresolved);
        REQUIRE(r.tests.at("t2") == TestOutcome::NotRun);
    }
}

TEST_CASE("FAIL_TO_FAIL never changes the verdict", "[evaluator]") {
    const OutcomeEvaluator evaluator;
    auto expected = expected_sets();
    expected.fail_to_fail = {"t9"};

    SECTION("still failing") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"passed","t2":"passed","t9":"failed"})"),
                                          expected);
        REQUIRE(r.verdict == Verdict::Resolved);
        REQUIRE(r.stale_expectations.empty());
    }

    SECTION("now passing is reported as stale") {
        const auto r = evaluator.evaluate("i", execution_with(R"({"t1":"passed","t2":"passed","t9":"passed"})"),
                                          expected);
        REQUIRE(r.verdict == Verdict::Resolved);
        REQUIRE(r.stale_expectations == std::vector<std::string>{"t9"});
    }
}

TEST_CASE("Absent or broken report is an error for every expected test", "[evaluator][errors]") {
    const OutcomeEvaluator evaluator;
    auto expected = expected_sets();
    expected.fail_to_fail = {"t9"};

    ExecutionResult missing = execution_with("");
    missing.structured_report.reset();

    for (const auto& execution : {missing, execution_with("not json"), execution_with("   ")}) {
        const auto r = evaluator.evaluate("i", execution, expected);
        REQUIRE(r.verdict == Verdict::Error);
        REQUIRE(r.error == ErrorKind::MissingReport);
        REQUIRE(r.tests.size() == 3);
        for (const auto& [id, outcome] : r.tests) {
            REQUIRE(outcome == TestOutcome::Error);
        }
        REQUIRE(r.log_excerpt.find("3 passed") != std::string::npos);
    }
}

TEST_CASE("pytest-json-report layout is understood", "[evaluator][report]") {
    const std::string text = R"({
        "created": 1700000000.0,
        "tests": [
            {"nodeid": "tests/test_a.py::test_one", "outcome": "passed"},
            {"nodeid": "tests/test_a.py::test_two", "outcome": "skipped"},
            {"nodeid": "tests/test_a.py::test_three", "outcome": "xfailed"},
            {"nodeid": "tests/test_a.py::test_four", "outcome": "failed"},
            {"nodeid": "tests/test_a.py::test_five", "outcome": "xpassed"},
            {"nodeid": "tests/test_a.py::test_six", "outcome": "error"},
            {"outcome": "passed"}
        ],
        "collectors": [
            {"nodeid": "tests/test_b.py", "outcome": "failed", "longrepr": "SyntaxError: invalid syntax"},
            {"nodeid": "tests/test_a.py", "outcome": "passed"}
        ]
    })";

    std::string diag;
    const auto report = parse_structured_report(text, ReportOptions{}, diag);
    REQUIRE(report.has_value());
    REQUIRE(report->outcomes.size() == 6);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_one") == TestOutcome::Passed);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_two") == TestOutcome::Passed);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_three") == TestOutcome::Failed);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_four") == TestOutcome::Failed);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_five") == TestOutcome::Failed);
    REQUIRE(report->outcomes.at("tests/test_a.py::test_six") == TestOutcome::Error);
    REQUIRE(report->collector_errors.size() == 1);
    REQUIRE(report->collector_errors[0].nodeid == "tests/test_b.py");
    REQUIRE(report->collector_errors[0].longrepr == "SyntaxError: invalid syntax");
    REQUIRE_FALSE(report->collector_errors[0].import_failure());
    REQUIRE_FALSE(diag.empty());   // the entry without nodeid

    SECTION("skips can be counted as failures") {
        std::string d;
        const auto strict = parse_structured_report(text, ReportOptions{false}, d);
        REQUIRE(strict->outcomes.at("tests/test_a.py::test_two") == TestOutcome::Failed);
    }
}

TEST_CASE("An expected-failure test never counts as passing", "[evaluator]") {
    const OutcomeEvaluator evaluator;
    const auto r = evaluator.evaluate(
        "i", execution_with(R"({"tests":[{"nodeid":"t1","outcome":"xfailed"},{"nodeid":"t2","outcome":"skipped"}]})"),
        expected_sets());
    REQUIRE(r.tests.at("t1") == TestOutcome::Failed);
    REQUIRE(r.tests.at("t2") == TestOutcome::Passed);
    REQUIRE(r.verdict == Verdict::Unresolved);
}

TEST_CASE("A test module that fails to import is an environment error", "[evaluator][collection]") {
    const OutcomeEvaluator evaluator;
    const std::string text = R"({
        "tests": [],
        "collectors": [
            {"nodeid": "tests/test_new.py", "outcome": "failed",
             "longrepr": "ImportError while importing test module 'tests/test_new.py'.\nE   ImportError: cannot import name 'helper' from 'pkg'"}
        ]
    })";
    ExpectedSets expected;
    expected.fail_to_pass = {"tests/test_new.py::test_a"};

    SECTION("expected tests selected") {
        const auto r = evaluator.evaluate("i", execution_with(text), expected);
        REQUIRE(r.verdict == Verdict::Error);
        REQUIRE(r.error == ErrorKind::Collection);
        REQUIRE(r.tests.at("tests/test_new.py::test_a") == TestOutcome::Error);
        REQUIRE(r.log_excerpt.find("cannot import name 'helper'") != std::string::npos);
    }

    SECTION("test files selected, nothing expected yet") {
        const auto r = evaluator.evaluate("i", execution_with(text), ExpectedSets{}, {"tests/test_new.py"});
        REQUIRE(r.error == ErrorKind::Collection);
    }

    SECTION("missing module") {
        const auto r = evaluator.evaluate(
            "i",
            execution_with(R"({"tests":[],"collectors":[{"nodeid":"tests/test_new.py","outcome":"failed",)"
                           R"("longrepr":"E   ModuleNotFoundError: No module named 'yaml'"}]})"),
            expected);
        REQUIRE(r.error == ErrorKind::Collection);
    }

    SECTION("nothing selected") {
        const auto r = evaluator.evaluate("i", execution_with(text), ExpectedSets{});
        REQUIRE(r.error == ErrorKind::None);
    }

    SECTION("other collection failures only warn") {
        const auto r = evaluator.evaluate(
            "i",
            execution_with(R"({"tests":[{"nodeid":"t1","outcome":"passed"},{"nodeid":"t2","outcome":"passed"}],)"
                           R"("collectors":[{"nodeid":"tests/test_b.py","outcome":"failed","longrepr":"SyntaxError"}]})"),
            expected_sets());
        REQUIRE(r.verdict == Verdict::Resolved);
    }
}

TEST_CASE("Duplicated test ids keep the worst outcome", "[evaluator][report]") {
    std::string diag;
    const auto report = parse_structured_report(
        R"({"tests":[{"nodeid":"t","outcome":"failed"},{"nodeid":"t","outcome":"passed"}]})", ReportOptions{}, diag);
    REQUIRE(report->outcomes.at("t") == TestOutcome::Failed);
}

TEST_CASE("Malformed reports are rejected with a reason", "[evaluator][report]") {
    std::string diag;
    REQUIRE_FALSE(parse_structured_report("[1, 2]", ReportOptions{}, diag).has_value());
    REQUIRE_FALSE(parse_structured_report(R"({"tests": 3})", ReportOptions{}, diag).has_value());
    REQUIRE_FALSE(parse_structured_report(R"({"t1": 1})", ReportOptions{}, diag).has_value());
    REQUIRE_FALSE(diag.empty());

    SECTION("non-string outcome in the pytest layout") {
        const OutcomeEvaluator evaluator;
        const auto r = evaluator.evaluate("i", execution_with(R"({"tests":[{"nodeid":"t1","outcome":1}]})"),
                                          expected_sets());
        REQUIRE(r.error == ErrorKind::MissingReport);
        REQUIRE(r.log_excerpt.find("'t1'") != std::string::npos);
    }
}

TEST_CASE("Error results fill every expected test", "[evaluator]") {
    auto expected = expected_sets();
    expected.pass_to_pass.push_back("t1");   // duplicates collapse
    const auto r = make_error_result("i", expected, ErrorKind::Build, TestOutcome::NotRun, "log");
    REQUIRE(r.verdict == Verdict::Error);
    REQUIRE(r.error == ErrorKind::Build);
    REQUIRE(r.tests.size() == 2);
    REQUIRE(r.tests.at("t1") == TestOutcome::NotRun);
    REQUIRE(r.log_excerpt == "log");
}
