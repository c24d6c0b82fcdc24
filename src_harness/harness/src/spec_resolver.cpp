#include "patchgrade_harness/spec_resolver.hpp"
#include "patchgrade_harness/content_hash.hpp"
#include "patchgrade_harness/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using patchgrade::harness::ContentHasher;
using patchgrade::harness::InvalidSpecError;
using patchgrade::harness::shell_quote;
using patchgrade::harness::Stage;
using patchgrade::harness::StageFile;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kHashSeed = "patchgrade/stage-chain/v1";
constexpr std::string_view kNoTestsPlaceholder = "patchgrade_no_tests_selected.py";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

void replace_all(std::string& text, std::string_view needle, std::string_view replacement) {
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
}

std::string basename_of(std::string_view name) {
    const auto slash = name.find_last_of('/');
    std::string base{slash == std::string_view::npos ? name : name.substr(slash + 1)};
    return base.empty() ? std::string{"requirements.lock"} : base;
}

// Folds the common inputs plus any stage-specific extras, then seals the stage.
Stage seal_stage(std::string_view name,
                 const std::string& previous_hash,
                 bool network_isolated,
                 std::vector<std::string> commands,
                 const std::vector<std::string_view>& extra_inputs,
                 std::vector<StageFile> files = {}) {
    ContentHasher hasher;
    hasher.field(previous_hash).field(name).field(network_isolated ? "isolated" : "networked");
    for (const auto extra : extra_inputs) {
        hasher.field(extra);
    }
    hasher.field(std::to_string(files.size()));
    for (const auto& file : files) {
        hasher.field(file.path).field(file.content);
    }
    hasher.field(std::to_string(commands.size()));
    for (const auto& command : commands) {
        hasher.field(command);
    }

    Stage stage;
    stage.name = std::string{name};
    stage.hash = hasher.hex_digest();
    stage.network_isolated = network_isolated;
    stage.files = std::move(files);
    stage.commands = std::move(commands);
    return stage;
}

std::string rewrite_install(std::string install) {
    // The install stage runs without network: dependencies are already in place.
    constexpr std::string_view kPip = "pip install";
    constexpr std::string_view kOffline = "pip install --no-deps --no-build-isolation";
    if (install.find(kOffline) == std::string::npos) {
        replace_all(install, kPip, kOffline);
    }
    return install;
}

bool mentions_flag(const std::string& command, std::string_view flag) {
    const auto at = command.find(flag);
    if (at == std::string::npos) return false;
    const auto end = at + flag.size();
    return end == command.size() || command[end] == ' ';
}

std::string render_test_command(const std::string& templ,
                                const std::vector<std::string>& tests,
                                const std::string& report_path,
                                const patchgrade::harness::TestRunOptions& run,
                                bool exit_first) {
    std::string command = trim_copy(templ);
    if (!tests.empty() && exit_first && !mentions_flag(command, "-x") && !mentions_flag(command, "--exitfirst")) {
        command += " --exitfirst";
    }

    std::string quoted_tests;
    if (tests.empty()) {
        quoted_tests = std::string{kNoTestsPlaceholder};
    } else {
        for (const auto& test : tests) {
            if (!quoted_tests.empty()) quoted_tests += ' ';
            quoted_tests += shell_quote(test);
        }
    }

    const bool has_report = command.find("{report}") != std::string::npos;
    const bool has_tests = command.find("{tests}") != std::string::npos;

    replace_all(command, "{report}", shell_quote(report_path));
    if (!has_report && command.find("json-report") == std::string::npos) {
        command += " --tb=short --json-report --json-report-file=" + shell_quote(report_path) +
                   " -W ignore::DeprecationWarning";
    }
    if (!tests.empty() && run.per_test_timeout && command.find("--timeout") == std::string::npos) {
        command += " --timeout " + std::to_string(run.per_test_timeout->count());
    }
    if (has_tests) {
        replace_all(command, "{tests}", quoted_tests);
    } else {
        command += " " + quoted_tests;
    }
    if (tests.empty()) {
        command = "echo 'No test to run' && " + command;
    }
    return command;
}

}  // namespace

namespace patchgrade::harness {

const Stage* BuildPlan::stage(std::string_view name) const noexcept {
    const auto it = std::find_if(stages.begin(), stages.end(),
                                 [&](const Stage& s) { return s.name == name; });
    return it == stages.end() ? nullptr : &*it;
}

std::string normalize_runtime_version(std::string_view raw) {
    std::string text = trim_copy(raw);
    std::string lowered;
    lowered.reserve(text.size());
    for (unsigned char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (lowered.rfind("python", 0) == 0) {
        lowered = trim_copy(std::string_view{lowered}.substr(6));
    }

    // MAJOR.MINOR[.PATCH], digits only.
    std::size_t groups = 0;
    std::size_t digits_in_group = 0;
    for (char ch : lowered) {
        if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            ++digits_in_group;
        } else if (ch == '.' && digits_in_group > 0) {
            ++groups;
            digits_in_group = 0;
        } else {
            return {};
        }
    }
    if (digits_in_group == 0) {
        return {};
    }
    ++groups;
    if (groups < 2 || groups > 3) {
        return {};
    }
    return lowered;
}

std::string shell_quote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

SpecResolver::SpecResolver(Config config) : config_{std::move(config)} {}

BuildPlan SpecResolver::resolve(const Instance& instance, const EnvironmentSpec& spec) const {
    return resolve(instance, spec, instance.expected.all());
}

BuildPlan SpecResolver::resolve(const Instance& instance,
                                const EnvironmentSpec& spec,
                                std::vector<std::string> selected_tests) const {
    TestRunOptions run;
    run.selected_tests = std::move(selected_tests);
    return resolve(instance, spec, run);
}

BuildPlan SpecResolver::resolve(const Instance& instance,
                                const EnvironmentSpec& spec,
                                const TestRunOptions& run) const {
    if (trim_copy(spec.test_cmd).empty()) {
        throw InvalidSpecError("test command template is empty (environment '" + spec.version_tag + "')");
    }
    const std::string runtime = normalize_runtime_version(spec.runtime_version);
    if (runtime.empty()) {
        throw InvalidSpecError("unparseable runtime version '" + spec.runtime_version + "'");
    }
    if (trim_copy(instance.repo).empty()) {
        throw InvalidSpecError("instance '" + instance.id + "' has no repository");
    }
    if (trim_copy(instance.base_commit).empty()) {
        throw InvalidSpecError("instance '" + instance.id + "' has no base commit");
    }

    BuildPlan plan;
    plan.base_image = config_.base_image_prefix + runtime + config_.base_image_suffix;
    plan.report_path = config_.report_path;
    plan.selected_tests = run.selected_tests ? *run.selected_tests : instance.expected.all();

    const std::string& workdir = config_.workdir;
    const std::string& hdir = config_.harness_dir;

    // base: runtime image plus the tools every later stage relies on.
    {
        std::vector<std::string> commands{
            "apt-get update && apt-get install -y --no-install-recommends git patch time ca-certificates"
            " && rm -rf /var/lib/apt/lists/*",
            "pip install --no-cache-dir uv",
            "mkdir -p " + shell_quote(workdir) + " " + shell_quote(hdir + "/patches"),
        };
        plan.stages.push_back(seal_stage(stage_names::kBase, std::string{kHashSeed}, false,
                                         std::move(commands), {plan.base_image, runtime}));
    }

    // clone
    {
        const std::string url = config_.git_host + trim_copy(instance.repo) + ".git";
        std::vector<std::string> commands{
            "git clone --recurse-submodules " + shell_quote(url) + " " + shell_quote(workdir),
        };
        plan.stages.push_back(seal_stage(stage_names::kClone, plan.stages.back().hash, false,
                                         std::move(commands), {instance.repo}));
    }

    // pre_install
    {
        std::vector<std::string> commands;
        for (const auto& raw : spec.pre_install) {
            auto command = trim_copy(raw);
            if (!command.empty()) commands.push_back(std::move(command));
        }
        const bool has_update = std::any_of(commands.begin(), commands.end(), [](const std::string& c) {
            return c.find("apt-get update") != std::string::npos;
        });
        if (!commands.empty() && !has_update) {
            commands.insert(commands.begin(), "apt-get update");
        }
        plan.stages.push_back(seal_stage(stage_names::kPreInstall, plan.stages.back().hash, false,
                                         std::move(commands), {}));
    }

    // dependency_install: frozen manifest wins over the inline list.
    {
        std::vector<std::string> commands;
        std::vector<StageFile> files;
        if (spec.frozen_manifest) {
            if (!spec.packages.empty()) {
                plan.warnings.push_back("environment '" + spec.version_tag + "': frozen manifest '" +
                                        spec.frozen_manifest->name + "' overrides " +
                                        std::to_string(spec.packages.size()) +
                                        " inline package(s); inline list ignored");
            }
            const std::string manifest_path = hdir + "/" + basename_of(spec.frozen_manifest->name);
            files.push_back(StageFile{manifest_path, spec.frozen_manifest->content});
            commands.push_back("uv pip install --system -r " + shell_quote(manifest_path));
        } else if (!spec.packages.empty()) {
            std::string install = "uv pip install --system -U";
            for (const auto& pkg : spec.packages) {
                install += " " + shell_quote(trim_copy(pkg));
            }
            commands.push_back(std::move(install));
        }
        commands.emplace_back("uv pip install --system pytest pytest-json-report pytest-timeout");
        plan.stages.push_back(seal_stage(stage_names::kDependencyInstall, plan.stages.back().hash, false,
                                         std::move(commands), {}, std::move(files)));
    }

    // git_checkout
    {
        std::vector<std::string> commands{
            "git -C " + shell_quote(workdir) + " checkout -f " + shell_quote(trim_copy(instance.base_commit)),
        };
        plan.stages.push_back(seal_stage(stage_names::kGitCheckout, plan.stages.back().hash, true,
                                         std::move(commands), {instance.base_commit}));
    }

    // install
    {
        std::vector<std::string> commands;
        if (auto install = trim_copy(spec.install); !install.empty()) {
            commands.push_back(rewrite_install(std::move(install)));
        }
        plan.stages.push_back(seal_stage(stage_names::kInstall, plan.stages.back().hash, true,
                                         std::move(commands), {}));
    }

    // eval_commands: sourced by the test script so exported variables reach the tests.
    {
        std::string prelude;
        for (const auto& raw : spec.eval_commands) {
            auto command = trim_copy(raw);
            if (!command.empty()) prelude += command + "\n";
        }
        plan.stages.push_back(seal_stage(stage_names::kEvalCommands, plan.stages.back().hash, true, {}, {},
                                         {StageFile{hdir + "/eval_prelude.sh", prelude}}));
    }

    // test_cmd
    {
        const std::string script_path = hdir + "/run_tests.sh";
        std::string script = "#!/bin/bash\n";
        script += "cd " + shell_quote(workdir) + "\n";
        script += "rm -f " + shell_quote(plan.report_path) + "\n";
        script += ". " + shell_quote(hdir + "/eval_prelude.sh") + "\n";
        script += render_test_command(spec.test_cmd, plan.selected_tests, plan.report_path, run,
                                      config_.exit_first) + "\n";

        std::vector<std::string> commands{"chmod +x " + shell_quote(script_path)};
        plan.stages.push_back(seal_stage(stage_names::kTestCmd, plan.stages.back().hash, true,
                                         std::move(commands), {}, {StageFile{script_path, script}}));
        plan.test_command = "bash " + shell_quote(script_path);
    }

    return plan;
}

}  // namespace patchgrade::harness
