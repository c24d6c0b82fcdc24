#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model.hpp"

namespace patchgrade::harness {

/// File a stage places in the image before its commands run.
struct StageFile {
    std::string path;
    std::string content;
};

/**
 * \brief One layer of the build plan.
 *
 * `hash` is the cache key: it folds the previous stage hash, so any change to
 * a stage invalidates every stage after it. Files are streamed into the
 * container, never inlined in a command line.
 */
struct Stage {
    std::string name;
    std::string hash;
    bool network_isolated{false};
    std::vector<StageFile> files;
    std::vector<std::string> commands;

    /// Nothing to run and nothing to write: the stage reuses its parent image.
    [[nodiscard]] bool empty() const noexcept { return files.empty() && commands.empty(); }
};

/**
 * \brief Concrete, ordered build recipe for one instance.
 */
struct BuildPlan {
    std::string base_image;
    std::vector<Stage> stages;
    std::string test_command;   ///< What the execution engine runs inside the final image
    std::string report_path;    ///< Where the test runner leaves its structured report
    std::vector<std::string> selected_tests;
    std::vector<std::string> warnings;

    /// Stage by name, nullptr when absent.
    [[nodiscard]] const Stage* stage(std::string_view name) const noexcept;
};

namespace stage_names {
inline constexpr std::string_view kBase = "base";
inline constexpr std::string_view kClone = "clone";
inline constexpr std::string_view kPreInstall = "pre_install";
inline constexpr std::string_view kDependencyInstall = "dependency_install";
inline constexpr std::string_view kGitCheckout = "git_checkout";
inline constexpr std::string_view kInstall = "install";
inline constexpr std::string_view kEvalCommands = "eval_commands";
inline constexpr std::string_view kTestCmd = "test_cmd";
}  // namespace stage_names

/**
 * \brief Per-run knobs of the rendered test command.
 */
struct TestRunOptions {
    std::optional<std::vector<std::string>> selected_tests{};   ///< Expected ids when absent
    std::optional<std::chrono::seconds> per_test_timeout{};     ///< pytest-timeout `--timeout`
};

/**
 * \brief Turns (Instance, EnvironmentSpec) into a BuildPlan.
 *
 * Pure and deterministic: no I/O, no clock, no environment lookups. Throws
 * InvalidSpecError when
 *   - the test command template is empty,
 *   - the runtime version is not `[python]MAJOR.MINOR[.PATCH]`,
 *   - the repository or base commit is empty.
 *
 * A frozen manifest always wins over the inline package list; when both are
 * given the plan carries a warning and the list is ignored.
 *
 * Test command template placeholders: `{tests}` (shell-quoted test ids) and
 * `{report}` (report path). Without `{report}`, pytest-json-report flags are
 * appended unless the template already mentions `json-report`; without
 * `{tests}`, the ids are appended. When tests are selected, `--timeout` and
 * (with `exit_first`) `--exitfirst` are added as well.
 */
class SpecResolver {
public:
    struct Config {
        std::string base_image_prefix{"python:"};
        std::string base_image_suffix{"-slim"};
        std::string git_host{"https://github.com/"};
        std::string workdir{"/workspace"};
        std::string harness_dir{"/harness"};
        std::string report_path{"/harness/report.json"};
        bool exit_first{false};   ///< Stop at the first failing test (fail-fast runs)
    };

    SpecResolver() = default;
    explicit SpecResolver(Config config);

    /// Selects the instance's expected tests.
    [[nodiscard]] BuildPlan resolve(const Instance& instance, const EnvironmentSpec& spec) const;

    /// Runs `selected_tests` instead of the expected ids (produce mode selects whole test files).
    [[nodiscard]] BuildPlan resolve(const Instance& instance,
                                    const EnvironmentSpec& spec,
                                    std::vector<std::string> selected_tests) const;

    [[nodiscard]] BuildPlan resolve(const Instance& instance,
                                    const EnvironmentSpec& spec,
                                    const TestRunOptions& run) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_{};
};

/// Normalises `python3.9`, `3.9`, `3.10.4` to the numeric form; empty when unparseable.
[[nodiscard]] std::string normalize_runtime_version(std::string_view raw);

/// POSIX shell single-quoting.
[[nodiscard]] std::string shell_quote(std::string_view value);

}  // namespace patchgrade::harness
