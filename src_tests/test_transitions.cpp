#include <catch2/catch.hpp>

#include "patchgrade_harness/transitions.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace patchgrade::harness;

namespace {

RunResult run_with(std::map<std::string, TestOutcome> tests, ErrorKind error = ErrorKind::None) {
    RunResult r;
    r.instance_id = "org__a-1";
    r.tests = std::move(tests);
    r.error = error;
    r.verdict = error == ErrorKind::None ? Verdict::Unresolved : Verdict::Error;
    return r;
}

using V = std::vector<std::string>;

const char* kTestPatch =
    "diff --git a/pkg/tests/test_core.py b/pkg/tests/test_core.py\n"
    "--- a/pkg/tests/test_core.py\n"
    "+++ b/pkg/tests/test_core.py\n"
    "@@ -1,3 +1,4 @@\n"
    "+import pytest\n"
    "diff --git a/pkg/util_test.py b/pkg/util_test.py\n"
    "new file mode 100644\n"
    "--- /dev/null\n"
    "+++ b/pkg/util_test.py\n"
    "@@ -0,0 +1,2 @@\n"
    "+def test_x(): pass\n"
    "diff --git a/pkg/tests/test_old.py b/pkg/tests/test_old.py\n"
    "deleted file mode 100644\n"
    "--- a/pkg/tests/test_old.py\n"
    "+++ /dev/null\n"
    "@@ -1,2 +0,0 @@\n"
    "-def test_y(): pass\n"
    "diff --git a/pkg/core.py b/pkg/core.py\n"
    "--- a/pkg/core.py\n"
    "+++ b/pkg/core.py\n"
    "@@ -1 +1 @@\n"
    "-x = 1\n"
    "+x = 2\n"
    "diff --git a/docs/tests.py b/docs/tests.py\n"
    "--- a/docs/tests.py\n"
    "+++ b/docs/tests.py\n"
    "@@ -1 +1 @@\n"
    "+pass\n";

}  // namespace

TEST_CASE("Transitions compare the runs before and after the reference patch", "[transitions]") {
    const auto before = run_with({{"a", TestOutcome::Failed},
                                  {"b", TestOutcome::Passed},
                                  {"c", TestOutcome::Error},
                                  {"d", TestOutcome::Passed},
                                  {"e", TestOutcome::NotRun}});
    const auto after = run_with({{"a", TestOutcome::Passed},
                                 {"b", TestOutcome::Passed},
                                 {"c", TestOutcome::Failed},
                                 {"d", TestOutcome::Error},
                                 {"e", TestOutcome::Passed}});

    const auto record = classify_transitions(before, after);
    REQUIRE_FALSE(record.error.has_value());
    REQUIRE(record.instance_id == "org__a-1");
    REQUIRE(record.fail_to_pass == V{"a"});
    REQUIRE(record.pass_to_pass == V{"b"});
    REQUIRE(record.fail_to_fail == V{"c"});
    REQUIRE(record.pass_to_fail == V{"d"});
}

TEST_CASE("An errored baseline makes every passing test FAIL_TO_PASS", "[transitions]") {
    const auto before = run_with({}, ErrorKind::MissingReport);
    const auto after = run_with({{"z", TestOutcome::Passed}, {"a", TestOutcome::Passed}, {"f", TestOutcome::Failed}});
    const auto record = classify_transitions(before, after);
    REQUIRE(record.fail_to_pass == V{"a", "z"});
    REQUIRE(record.fail_to_fail == V{"f"});
    REQUIRE(record.pass_to_pass.empty());
}

TEST_CASE("A baseline that cannot import the new tests labels them FAIL_TO_PASS", "[transitions][collection]") {
    auto before = run_with({}, ErrorKind::Collection);
    before.verdict = Verdict::Error;
    const auto after = run_with({{"tests/test_new.py::test_a", TestOutcome::Passed},
                                 {"tests/test_new.py::test_b", TestOutcome::Failed}});
    const auto record = classify_transitions(before, after);
    REQUIRE_FALSE(record.error.has_value());
    REQUIRE(record.fail_to_pass == V{"tests/test_new.py::test_a"});
    REQUIRE(record.fail_to_fail == V{"tests/test_new.py::test_b"});
}

TEST_CASE("An errored reference run yields no labels", "[transitions]") {
    const auto before = run_with({{"a", TestOutcome::Failed}});
    const auto after = run_with({{"a", TestOutcome::Error}}, ErrorKind::Build);
    const auto record = classify_transitions(before, after);
    REQUIRE(record.error == std::optional<std::string>{"build"});
    REQUIRE(record.fail_to_pass.empty());
}

TEST_CASE("Modified test files are extracted from the test patch", "[transitions][patch]") {
    SECTION("added and modified test files, deletions and sources skipped") {
        REQUIRE(extract_modified_test_files(kTestPatch) == V{"docs/tests.py", "pkg/tests/test_core.py", "pkg/util_test.py"});
    }

    SECTION("black-listed files are skipped") {
        REQUIRE(extract_modified_test_files(kTestPatch, "docs/tests.py pkg/util_test.py") ==
                V{"pkg/tests/test_core.py"});
    }

    SECTION("empty patch") {
        REQUIRE(extract_modified_test_files("").empty());
    }
}
