#include "patchgrade_harness/transitions.hpp"

#include <regex>
#include <set>
#include <sstream>
#include <string>

namespace {

using patchgrade::harness::RunResult;
using patchgrade::harness::TestOutcome;

bool is_passing(TestOutcome outcome) noexcept {
    return outcome == TestOutcome::Passed;
}

bool is_failing(TestOutcome outcome) noexcept {
    return outcome == TestOutcome::Failed || outcome == TestOutcome::Error;
}

std::set<std::string> select(const RunResult& result, bool (*predicate)(TestOutcome) noexcept) {
    std::set<std::string> out;
    for (const auto& [id, outcome] : result.tests) {
        if (predicate(outcome)) out.insert(id);
    }
    return out;
}

std::vector<std::string> intersect(const std::set<std::string>& a, const std::set<std::string>& b) {
    std::vector<std::string> out;
    for (const auto& id : a) {
        if (b.count(id) != 0) out.push_back(id);
    }
    return out;
}

}  // namespace

namespace patchgrade::harness {

TransitionRecord classify_transitions(const RunResult& before, const RunResult& after) {
    TransitionRecord record;
    record.instance_id = after.instance_id;
    if (after.error != ErrorKind::None) {
        record.error = std::string{to_string(after.error)};
        return record;
    }

    const auto after_pass = select(after, is_passing);
    const auto after_fail = select(after, is_failing);

    if (before.error != ErrorKind::None) {
        record.fail_to_pass.assign(after_pass.begin(), after_pass.end());
        record.fail_to_fail.assign(after_fail.begin(), after_fail.end());
        return record;
    }

    const auto before_pass = select(before, is_passing);
    const auto before_fail = select(before, is_failing);
    record.fail_to_pass = intersect(before_fail, after_pass);
    record.pass_to_pass = intersect(before_pass, after_pass);
    record.fail_to_fail = intersect(before_fail, after_fail);
    record.pass_to_fail = intersect(before_pass, after_fail);
    return record;
}

std::vector<std::string> extract_modified_test_files(std::string_view test_patch, std::string_view black_list) {
    static const std::regex kTestFileHeader(
        R"(^diff --git a/((?:.*/)*(?:test_.*|tests_.*|.*_test|.*_tests|test|tests)\.py) b/)");

    std::set<std::string> blocked;
    {
        std::istringstream words{std::string{black_list}};
        std::string word;
        while (words >> word) blocked.insert(word);
    }

    std::set<std::string> files;
    std::string current;
    bool deleted = false;

    std::istringstream input{std::string{test_patch}};
    std::string line;
    while (std::getline(input, line)) {
        if (line.rfind("diff --git", 0) == 0) {
            std::smatch match;
            current = std::regex_search(line, match, kTestFileHeader) ? match[1].str() : std::string{};
            if (blocked.count(current) != 0) {
                current.clear();
            }
            deleted = false;
        } else if (line.rfind("+++ /dev/null", 0) == 0) {
            deleted = true;
        } else if (line.rfind("@@", 0) == 0) {
            if (!current.empty() && !deleted) {
                files.insert(current);
            }
        }
    }
    return {files.begin(), files.end()};
}

}  // namespace patchgrade::harness
