#include "patchgrade_harness/model.hpp"

#include <set>

namespace patchgrade::harness {

std::vector<std::string> ExpectedSets::all() const {
    std::vector<std::string> merged;
    std::set<std::string> seen;
    for (const auto* group : {&fail_to_pass, &pass_to_pass, &fail_to_fail}) {
        for (const auto& id : *group) {
            if (seen.insert(id).second) {
                merged.push_back(id);
            }
        }
    }
    return merged;
}

std::string_view to_string(TestOutcome outcome) noexcept {
    switch (outcome) {
        case TestOutcome::Passed: return "passed";
        case TestOutcome::Failed: return "failed";
        case TestOutcome::Error: return "error";
        case TestOutcome::NotRun: return "not-run";
    }
    return "error";
}

std::string_view to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::Resolved: return "RESOLVED";
        case Verdict::Unresolved: return "UNRESOLVED";
        case Verdict::Error: return "ERROR";
    }
    return "ERROR";
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidSpec: return "invalid_spec";
        case ErrorKind::Build: return "build";
        case ErrorKind::PatchApply: return "patch_apply";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::MissingReport: return "missing_report";
        case ErrorKind::Collection: return "collection";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

}  // namespace patchgrade::harness
