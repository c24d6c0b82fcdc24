#include "patchgrade_harness/harness.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/subprocess.hpp"

#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

}  // namespace

namespace patchgrade::harness {

std::string sanitize_name(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        const bool safe = std::isalnum(c) != 0 || c == '_' || c == '.' || c == '-';
        out.push_back(safe ? static_cast<char>(c) : '_');
    }
    if (out.empty() || std::isalnum(static_cast<unsigned char>(out.front())) == 0) {
        out.insert(out.begin(), 'i');
    }
    return out;
}

EvaluationHarness::EvaluationHarness(const SpecResolver& resolver,
                                     BuildPipeline& pipeline,
                                     ExecutionEngine& engine,
                                     const OutcomeEvaluator& evaluator,
                                     Config config,
                                     Logger& run_log)
    : resolver_{resolver},
      pipeline_{pipeline},
      engine_{engine},
      evaluator_{evaluator},
      config_{std::move(config)},
      run_log_{run_log} {}

fs::path EvaluationHarness::instance_dir(const std::string& instance_id) const {
    return config_.artifact_root / config_.log_dir_name / sanitize_name(instance_id);
}

RunResult EvaluationHarness::run(const InstanceJob& job, std::chrono::seconds timeout) {
    const auto started = Clock::now();
    const auto& instance = job.instance;
    const auto art_dir = instance_dir(instance.id);
    std::error_code ec;
    fs::create_directories(art_dir, ec);

    run_log_.debug("starting " + instance.id + ", artifacts in " + art_dir.string());
    Logger log(Logger::Config{instance.id, config_.console, config_.console_level, art_dir / "run_instance.log"});
    log.info("evaluating " + instance.id + " (" + instance.repo + " @ " + instance.base_commit + ", environment '" +
             job.environment.version_tag + "', timeout " + std::to_string(timeout.count()) + " s)");

    std::string diag;
    RunResult result;
    try {
        TestRunOptions run_options;
        run_options.selected_tests = job.test_selection;
        run_options.per_test_timeout = timeout;
        const auto plan = resolver_.resolve(instance, job.environment, run_options);
        for (const auto& warning : plan.warnings) {
            log.warning(warning);
        }
        for (const auto& stage : plan.stages) {
            log.debug("plan: " + stage.name + " " + stage.hash + (stage.network_isolated ? " isolated" : ""));
        }

        const std::string image = pipeline_.build(plan, log);
        log.info("environment image " + image);

        ExecutionRequest request;
        request.image = image;
        request.patches = {instance.test_patch, instance.patch};
        request.test_command = plan.test_command;
        request.timeout = timeout;
        request.report_path = plan.report_path;
        request.env = config_.container_env;
        request.container_name = "patchgrade-eval-" + sanitize_name(instance.id) + "-" +
                                 std::to_string(++container_seq_);
        for (std::size_t i = 0; i < request.patches.size(); ++i) {
            if (!request.patches[i].empty()) {
                (void)write_text(art_dir / ("patch_" + std::to_string(i) + ".diff"), request.patches[i], diag);
            }
        }

        const auto execution = engine_.run(request, log);
        (void)write_text(art_dir / "test_stdout.txt", execution.stdout_text, diag);
        (void)write_text(art_dir / "test_stderr.txt", execution.stderr_text, diag);
        if (execution.structured_report) {
            (void)write_text(art_dir / "report.json", *execution.structured_report, diag);
        }

        result = evaluator_.evaluate(instance.id, execution, instance.expected, plan.selected_tests, log);
    } catch (const TimeoutError& e) {
        (void)write_text(art_dir / "test_stdout.txt", e.partial_stdout(), diag);
        (void)write_text(art_dir / "test_stderr.txt", e.partial_stderr(), diag);
        log.error(e.what());
        result = make_error_result(instance.id, instance.expected, ErrorKind::Timeout, TestOutcome::NotRun,
                                   std::string{e.what()} + "\n" +
                                       tail_excerpt(e.partial_stdout() + e.partial_stderr(), config_.log_excerpt_bytes));
    } catch (const BuildError& e) {
        log.error(e.what());
        result = make_error_result(instance.id, instance.expected, ErrorKind::Build, TestOutcome::NotRun,
                                   std::string{e.what()} + "\n" + e.log_excerpt());
    } catch (const PatchApplyError& e) {
        log.error(e.what());
        result = make_error_result(instance.id, instance.expected, ErrorKind::PatchApply, TestOutcome::NotRun,
                                   std::string{e.what()} + "\n" + e.log_excerpt());
    } catch (const HarnessError& e) {
        log.error(e.what());
        result = make_error_result(instance.id, instance.expected, e.kind(), TestOutcome::Error, e.what());
    } catch (const std::exception& e) {
        log.error(std::string{"unexpected error: "} + e.what());
        result = make_error_result(instance.id, instance.expected, ErrorKind::Internal, TestOutcome::Error,
                                   e.what());
    }

    if (!diag.empty()) {
        log.warning("artifact write problems:\n" + diag);
    }
    result.elapsed = since(started);

    std::string summary = instance.id + ": " + std::string{to_string(result.verdict)};
    if (result.error != ErrorKind::None) {
        summary += " (" + std::string{to_string(result.error)} + ")";
    }
    summary += " in " + std::to_string(result.elapsed.count()) + " ms";
    log.info(summary);
    return result;
}

}  // namespace patchgrade::harness
