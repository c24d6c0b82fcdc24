#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchgrade::harness {

/**
 * \brief Expected test-outcome transition sets of one instance.
 *
 * Order is preserved as authored; duplicates carry no meaning.
 */
struct ExpectedSets {
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::vector<std::string> fail_to_fail;

    /// Union of the three sets, first occurrence order, duplicates removed.
    [[nodiscard]] std::vector<std::string> all() const;
};

/**
 * \brief One evaluation task.
 *
 * The scheduler owns instances for the duration of a run; nothing mutates them
 * once they have been loaded.
 */
struct Instance {
    std::string id;
    std::string repo;         ///< `owner/name`
    std::string base_commit;
    std::string patch;        ///< Candidate diff, empty for an unpatched baseline
    std::string test_patch;   ///< Diff adding or modifying tests
    ExpectedSets expected;
    std::string environment_ref{"default"};
    std::optional<std::chrono::seconds> timeout{};
};

/**
 * \brief Pinned dependency manifest, already read from disk.
 */
struct DependencyManifest {
    std::string name{"requirements.lock"};
    std::string content;
};

/**
 * \brief Declarative environment description.
 *
 * When `frozen_manifest` is set it is the only source of dependency versions;
 * `packages` is then kept for documentation and never reaches a build stage.
 */
struct EnvironmentSpec {
    std::string runtime_version;
    std::vector<std::string> pre_install;
    std::string install;
    std::vector<std::string> packages;
    std::optional<DependencyManifest> frozen_manifest{};
    std::vector<std::string> eval_commands;
    std::string test_cmd;
    std::string version_tag{"default"};
};

enum class TestOutcome { Passed, Failed, Error, NotRun };

enum class Verdict { Resolved, Unresolved, Error };

/// Why a RunResult ended in Verdict::Error (None otherwise).
enum class ErrorKind { None, InvalidSpec, Build, PatchApply, Timeout, MissingReport, Collection, Internal };

[[nodiscard]] std::string_view to_string(TestOutcome outcome) noexcept;
[[nodiscard]] std::string_view to_string(Verdict verdict) noexcept;
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * \brief Per-instance record handed back to the scheduler.
 */
struct RunResult {
    std::string instance_id;
    std::map<std::string, TestOutcome> tests;
    std::chrono::milliseconds elapsed{0};
    std::string log_excerpt;
    Verdict verdict{Verdict::Error};
    ErrorKind error{ErrorKind::None};
    std::vector<std::string> stale_expectations;  ///< FAIL_TO_FAIL ids that passed
};

}  // namespace patchgrade::harness
