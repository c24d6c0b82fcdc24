#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "patchgrade_harness/build_pipeline.hpp"
#include "patchgrade_harness/config.hpp"
#include "patchgrade_harness/dataset_loader.hpp"
#include "patchgrade_harness/docker_bridge.hpp"
#include "patchgrade_harness/execution_engine.hpp"
#include "patchgrade_harness/harness.hpp"
#include "patchgrade_harness/image_cache.hpp"
#include "patchgrade_harness/logger.hpp"
#include "patchgrade_harness/outcome_evaluator.hpp"
#include "patchgrade_harness/report_writer.hpp"
#include "patchgrade_harness/scheduler.hpp"
#include "patchgrade_harness/spec_resolver.hpp"
#include "patchgrade_harness/transitions.hpp"

namespace ph = patchgrade::harness;
namespace fs = std::filesystem;

namespace {

enum class Mode { Evaluate, Produce };

struct Args {
    fs::path dataset;
    fs::path env_specs{};
    std::string predictions{"gold"};
    std::vector<std::string> instance_ids;
    Mode mode{Mode::Evaluate};
    std::size_t max_workers{1};
    std::chrono::seconds timeout{std::chrono::minutes(30)};
    std::optional<std::chrono::seconds> global_timeout{};
    ph::FailFastPolicy fail_fast{ph::FailFastPolicy::Off};
    fs::path artifact_root{"logs"};
    fs::path summary_path{};
    fs::path html_path{};
    bool emit_html{true};
    std::string run_id{};
    std::string black_list{};
    bool output_passed{false};
    std::optional<bool> push_to_registry{};
    std::optional<bool> pull_from_registry{};
    std::optional<std::string> registry_url{};
    std::optional<std::string> registry_user{};
    std::optional<std::string> registry_pass{};
    std::string docker_exe{"docker"};
    bool verbose{false};
    bool help{false};
};

// Raised for malformed command lines and unusable inputs (exit code 2).
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void print_usage(const char* argv0) {
    std::cerr
        << "patchgrade - evaluate candidate patches against their test suites\n"
        << "Usage:\n"
        << "  " << argv0 << " --dataset <jsonl> [--env-specs <json>] [--predictions <jsonl|gold>]\n"
        << "                 [--instance-ids \"<id> <id>\"] [--mode evaluate|produce] [--max-workers N]\n"
        << "                 [--timeout SECONDS] [--global-timeout SECONDS] [--failfast error|unresolved]\n"
        << "                 [--artifact-dir DIR] [--summary PATH] [--html PATH] [--ci] [--run-id ID]\n"
        << "                 [--black-list \"<files>\"] [--output-passed]\n"
        << "                 [--push-to-registry] [--pull-from-registry] [--registry-url URL]\n"
        << "                 [--registry-user U] [--registry-pass P] [--docker PATH] [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --dataset          Instances, one JSON object per line.\n"
        << "  --env-specs        Environment spec document (one spec, or version tag -> spec).\n"
        << "  --predictions      Candidate patches (instance_id, model_patch) or 'gold' (default).\n"
        << "  --instance-ids     Whitespace-separated subset of instances to run.\n"
        << "  --mode             evaluate (default) or produce (derive FAIL_TO_PASS / PASS_TO_PASS).\n"
        << "  --max-workers      Instances evaluated in parallel (default: 1).\n"
        << "  --timeout          Per-instance wall-clock budget in seconds (default: 1800).\n"
        << "  --global-timeout   Stop dispatching new instances after this many seconds.\n"
        << "  --failfast         Stop dispatching after the first error or unresolved instance.\n"
        << "  --artifact-dir     Root directory for logs and reports (default: logs).\n"
        << "  --summary          JSON summary path (default: <artifact-dir>/<run-id>.json).\n"
        << "  --html             HTML report path (default: <artifact-dir>/<run-id>.html).\n"
        << "  --ci               CI mode: JSON only, no HTML report.\n"
        << "  --run-id           Run identifier used in report names (default: timestamp).\n"
        << "  --black-list       Produce mode: test files never selected.\n"
        << "  --output-passed    Produce mode: keep only instances with at least one FAIL_TO_PASS test.\n"
        << "                     Evaluate mode: also write the RESOLVED instances' records to\n"
        << "                     <artifact-dir>/<run-id>.resolved_dataset.jsonl.\n"
        << "  --push-to-registry / --pull-from-registry\n"
        << "                     Share stage images through a registry (also PATCHGRADE_* variables).\n"
        << "  --docker           Docker client executable (default: docker).\n"
        << "  --verbose          Print info-level log lines on the console.\n"
        << "  -h, --help         Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string value_of(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

std::size_t parse_count(const std::string& raw, std::string_view flag) {
    try {
        std::size_t used = 0;
        const auto value = std::stoul(raw, &used);
        if (used != raw.size() || value == 0) {
            throw std::invalid_argument(raw);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string{flag} + " expects a positive integer, got '" + raw + "'");
    }
}

std::vector<std::string> split_ws(const std::string& raw) {
    std::vector<std::string> out;
    std::string current;
    for (char ch : raw) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == ',') {
            if (!current.empty()) out.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "--dataset")) {
            args.dataset = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--env-specs")) {
            args.env_specs = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--predictions")) {
            args.predictions = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--instance-ids")) {
            const auto ids = split_ws(value_of(argc, argv, i, tok));
            args.instance_ids.insert(args.instance_ids.end(), ids.begin(), ids.end());
        } else if (arg_eq(tok, "--mode")) {
            const auto mode = value_of(argc, argv, i, tok);
            if (mode == "evaluate") {
                args.mode = Mode::Evaluate;
            } else if (mode == "produce") {
                args.mode = Mode::Produce;
            } else {
                throw ConfigError("--mode expects 'evaluate' or 'produce', got '" + mode + "'");
            }
        } else if (arg_eq(tok, "--max-workers")) {
            args.max_workers = parse_count(value_of(argc, argv, i, tok), tok);
        } else if (arg_eq(tok, "--timeout")) {
            args.timeout = std::chrono::seconds(parse_count(value_of(argc, argv, i, tok), tok));
        } else if (arg_eq(tok, "--global-timeout")) {
            args.global_timeout = std::chrono::seconds(parse_count(value_of(argc, argv, i, tok), tok));
        } else if (arg_eq(tok, "--failfast")) {
            const auto policy = value_of(argc, argv, i, tok);
            if (policy == "error") {
                args.fail_fast = ph::FailFastPolicy::OnError;
            } else if (policy == "unresolved") {
                args.fail_fast = ph::FailFastPolicy::OnUnresolved;
            } else {
                throw ConfigError("--failfast expects 'error' or 'unresolved', got '" + policy + "'");
            }
        } else if (arg_eq(tok, "--artifact-dir")) {
            args.artifact_root = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--ci")) {
            args.emit_html = false;
        } else if (arg_eq(tok, "--run-id")) {
            args.run_id = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--black-list")) {
            args.black_list = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--output-passed")) {
            args.output_passed = true;
        } else if (arg_eq(tok, "--push-to-registry")) {
            args.push_to_registry = true;
        } else if (arg_eq(tok, "--pull-from-registry")) {
            args.pull_from_registry = true;
        } else if (arg_eq(tok, "--registry-url")) {
            args.registry_url = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--registry-user")) {
            args.registry_user = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--registry-pass")) {
            args.registry_pass = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--docker")) {
            args.docker_exe = value_of(argc, argv, i, tok);
        } else if (arg_eq(tok, "--verbose")) {
            args.verbose = true;
        } else {
            throw ConfigError("unknown argument '" + std::string{tok} + "'");
        }
    }

    if (args.dataset.empty()) {
        throw ConfigError("--dataset is required");
    }
    if (args.run_id.empty()) {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        args.run_id = "run-" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }
    if (args.summary_path.empty()) {
        args.summary_path = args.artifact_root / (args.run_id + ".json");
    }
    if (args.html_path.empty()) {
        args.html_path = args.artifact_root / (args.run_id + ".html");
    }
    return args;
}

ph::RegistryConfig registry_config(const Args& args) {
    auto cfg = ph::RegistryConfig::from_environment();
    if (args.push_to_registry) cfg.push = *args.push_to_registry;
    if (args.pull_from_registry) cfg.pull = *args.pull_from_registry;
    if (args.registry_url) cfg.url = *args.registry_url;
    if (args.registry_user) cfg.user = *args.registry_user;
    if (args.registry_pass) cfg.password = *args.registry_pass;
    return cfg;
}

int aggregate_exit_code(const std::vector<ph::RunResult>& results) {
    for (const auto& r : results) {
        if (r.verdict != ph::Verdict::Resolved) return 1;
    }
    return 0;
}

// Produce mode: run the selected test files with the reference patch, then
// without it, and label every test by its transition.
std::vector<ph::TransitionRecord> produce(const std::vector<ph::InstanceJob>& base_jobs,
                                          const Args& args,
                                          ph::Scheduler& scheduler,
                                          const ph::SchedulerOptions& options,
                                          ph::Logger& run_log,
                                          std::vector<ph::RunResult>& golden_results) {
    std::vector<ph::InstanceJob> golden;
    for (const auto& job : base_jobs) {
        auto files = ph::extract_modified_test_files(job.instance.test_patch, args.black_list);
        if (files.empty()) {
            run_log.warning(job.instance.id + ": test patch touches no test file, skipped");
            continue;
        }
        ph::InstanceJob g = job;
        g.test_selection = std::move(files);
        g.environment.test_cmd += " --continue-on-collection-errors";
        golden.push_back(std::move(g));
    }

    run_log.info("produce: golden round over " + std::to_string(golden.size()) + " instances");
    golden_results = scheduler.run_all(golden, options);
    std::map<std::string, const ph::RunResult*> after;
    for (const auto& r : golden_results) after[r.instance_id] = &r;

    std::vector<ph::InstanceJob> before_jobs;
    for (const auto& job : golden) {
        const auto found = after.find(job.instance.id);
        if (found == after.end() || found->second->verdict == ph::Verdict::Error) {
            continue;
        }
        ph::InstanceJob b = job;
        b.instance.patch.clear();
        before_jobs.push_back(std::move(b));
    }

    run_log.info("produce: pre-golden round over " + std::to_string(before_jobs.size()) + " instances");
    const auto before_results = scheduler.run_all(before_jobs, options);
    std::map<std::string, const ph::RunResult*> before;
    for (const auto& r : before_results) before[r.instance_id] = &r;

    std::vector<ph::TransitionRecord> records;
    for (const auto& job : golden) {
        const auto a = after.find(job.instance.id);
        if (a == after.end()) continue;   // never dispatched
        ph::RunResult missing;
        missing.instance_id = job.instance.id;
        missing.verdict = ph::Verdict::Error;
        missing.error = ph::ErrorKind::Internal;
        const auto b = before.find(job.instance.id);
        records.push_back(ph::classify_transitions(b == before.end() ? missing : *b->second, *a->second));
    }
    return records;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const ConfigError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        std::filesystem::create_directories(args.artifact_root);
        ph::Logger run_log(ph::Logger::Config{"patchgrade",
                                              &std::cerr,
                                              args.verbose ? ph::LogLevel::Info : ph::LogLevel::Warning,
                                              args.artifact_root / "evaluation.log"});
        run_log.info("run " + args.run_id + " dataset " + args.dataset.string());

        std::vector<ph::InstanceJob> jobs;
        ph::Dataset dataset;
        try {
            ph::DatasetLoader loader;
            dataset = loader.load_instances(args.dataset);
            ph::EnvironmentCatalog catalog;
            if (!args.env_specs.empty()) {
                catalog = loader.load_environment_specs(args.env_specs);
            }
            std::map<std::string, std::string> predictions;
            if (args.predictions != "gold") {
                predictions = loader.load_predictions(args.predictions);
            }
            for (const auto& w : dataset.warnings) run_log.warning(w);
            for (const auto& w : catalog.warnings) run_log.warning(w);
            jobs = ph::assemble_jobs(dataset, catalog, predictions, args.instance_ids);
        } catch (const std::runtime_error& ex) {
            throw ConfigError(ex.what());
        }

        ph::docker_bridge::DockerCli docker(ph::docker_bridge::DockerCli::Config{args.docker_exe}, run_log);
        std::string diag;
        if (!docker.init(diag)) {
            throw ConfigError("docker is not usable:\n" + diag);
        }

        ph::RegistryConfig registry_cfg;
        try {
            registry_cfg = registry_config(args);
        } catch (const std::runtime_error& ex) {
            throw ConfigError(ex.what());
        }

        ph::BuildPipeline::Config pipeline_cfg;
        ph::ImageCache::Config cache_cfg;
        cache_cfg.local_probe = ph::BuildPipeline::local_probe(docker, pipeline_cfg);
        if (registry_cfg.enabled()) {
            ph::docker_bridge::DockerRegistry::Config reg;
            reg.docker_exe = args.docker_exe;
            reg.url = registry_cfg.url;
            reg.user = registry_cfg.user;
            reg.password = registry_cfg.password;
            reg.repository = pipeline_cfg.image_repository;
            reg.tag_hash_chars = pipeline_cfg.tag_hash_chars;
            cache_cfg.registry = std::make_shared<ph::docker_bridge::DockerRegistry>(reg, run_log);
            cache_cfg.pull_from_registry = registry_cfg.pull;
            cache_cfg.push_to_registry = registry_cfg.push;
            run_log.info("registry sync with " + registry_cfg.url);
        } else if (registry_cfg.push || registry_cfg.pull) {
            run_log.warning("registry sync requested without url and user, running local-only");
        }

        ph::ImageCache cache(cache_cfg, run_log);
        ph::BuildPipeline pipeline(docker, cache, pipeline_cfg, run_log);
        ph::ExecutionEngine engine(docker, ph::ExecutionEngine::Config{}, run_log);
        ph::SpecResolver::Config resolver_cfg;
        // Produce mode classifies every selected test, so it never stops early.
        resolver_cfg.exit_first = args.mode == Mode::Evaluate && args.fail_fast != ph::FailFastPolicy::Off;
        ph::SpecResolver resolver(resolver_cfg);
        ph::OutcomeEvaluator evaluator;

        ph::EvaluationHarness::Config harness_cfg;
        harness_cfg.artifact_root = args.artifact_root;
        harness_cfg.log_dir_name = args.mode == Mode::Produce ? "produce_logs" : "evaluate_logs";
        harness_cfg.console = &std::cerr;
        harness_cfg.console_level = args.verbose ? ph::LogLevel::Info : ph::LogLevel::Warning;
        ph::EvaluationHarness harness(resolver, pipeline, engine, evaluator, harness_cfg, run_log);

        ph::SchedulerOptions options;
        options.max_workers = args.max_workers;
        options.per_instance_timeout = args.timeout;
        options.fail_fast = args.fail_fast;
        options.global_timeout = args.global_timeout;
        ph::Scheduler scheduler(harness, run_log);

        ph::ReportWriter writer(args.run_id);
        std::vector<ph::RunResult> results;
        std::size_t produced = 0;
        fs::path transitions_path;
        fs::path dataset_out;

        if (args.mode == Mode::Evaluate) {
            results = scheduler.run_all(jobs, options);
            if (args.output_passed) {
                dataset_out = args.artifact_root / (args.run_id + ".resolved_dataset.jsonl");
                produced = writer.write_resolved_dataset(dataset_out, dataset.raw_records, results);
            }
        } else {
            const auto records = produce(jobs, args, scheduler, options, run_log, results);
            transitions_path = args.artifact_root / (args.run_id + ".transitions.json");
            dataset_out = args.artifact_root / (args.run_id + ".dataset.jsonl");
            writer.write_transitions(transitions_path, records);
            produced = writer.write_produced_dataset(dataset_out, dataset.raw_records, records, args.output_passed);
        }
        if (scheduler.not_dispatched() > 0) {
            run_log.warning(std::to_string(scheduler.not_dispatched()) + " instances were never dispatched");
        }

        writer.write_summary(args.summary_path, results);
        if (args.emit_html) {
            writer.write_detailed(args.html_path, results);
        }

        const auto stats = pipeline.stats();
        std::size_t resolved = 0, unresolved = 0, errors = 0;
        for (const auto& r : results) {
            if (r.verdict == ph::Verdict::Resolved) ++resolved;
            else if (r.verdict == ph::Verdict::Unresolved) ++unresolved;
            else ++errors;
        }

        std::cout << "patchgrade " << (args.mode == Mode::Produce ? "produce" : "evaluate") << " (" << args.run_id
                  << ")\n"
                  << "  Instances: " << results.size() << " of " << jobs.size() << "\n"
                  << "  RESOLVED: " << resolved << "  UNRESOLVED: " << unresolved << "  ERROR: " << errors << "\n"
                  << "  Images built: " << stats.commits << "  cache hits: " << stats.cache_hits << "\n"
                  << "Artifacts:\n"
                  << "  JSON: " << args.summary_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << args.html_path << "\n";
        }
        if (args.mode == Mode::Produce) {
            std::cout << "  Transitions: " << transitions_path << "\n"
                      << "  Dataset: " << dataset_out << " (" << produced << " records)\n";
        } else if (args.output_passed) {
            std::cout << "  Resolved dataset: " << dataset_out << " (" << produced << " records)\n";
        }

        if (args.mode == Mode::Produce) {
            return errors > 0 ? 1 : 0;
        }
        return aggregate_exit_code(results);
    } catch (const ConfigError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2; // configuration/environment issue
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 3;
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
