#include <catch2/catch.hpp>

#include "patchgrade_harness/dataset_loader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace patchgrade::harness;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed at scope exit.
class TempDir {
public:
    TempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("patchgrade_loader_" + std::to_string(stamp));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) const {
        const auto p = path_ / name;
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

private:
    fs::path path_;
};

const char* kDataset =
    R"({"instance_id": "org__a-1", "repo": "org/a", "base_commit": "c1", "patch": "P1", "test_patch": "T1", "FAIL_TO_PASS": ["t1"], "PASS_TO_PASS": "[\"t2\", \"t3\"]", "version": "1.0"})"
    "\n\n"
    R"({"instance_id": "org__a-2", "repo": "org/a", "base_commit": "c2", "patch": "P2", "test_patch": "T2", "FAIL_TO_PASS": "[]", "PASS_TO_PASS": [], "FAIL_TO_FAIL": ["t9"], "version": 2.0, "timeout": 90.5})"
    "\n";

}  // namespace

TEST_CASE("Dataset lines become instances", "[loader]") {
    TempDir dir;
    const auto file = dir.write("dataset.jsonl", kDataset);
    const auto dataset = DatasetLoader{}.load_instances(file);

    REQUIRE(dataset.instances.size() == 2);
    const auto& a = dataset.instances[0];
    REQUIRE(a.id == "org__a-1");
    REQUIRE(a.repo == "org/a");
    REQUIRE(a.base_commit == "c1");
    REQUIRE(a.patch == "P1");
    REQUIRE(a.test_patch == "T1");
    REQUIRE(a.expected.fail_to_pass == std::vector<std::string>{"t1"});
    REQUIRE(a.expected.pass_to_pass == std::vector<std::string>{"t2", "t3"});
    REQUIRE(a.environment_ref == "1.0");
    REQUIRE_FALSE(a.timeout.has_value());

    const auto& b = dataset.instances[1];
    REQUIRE(b.expected.fail_to_pass.empty());
    REQUIRE(b.expected.fail_to_fail == std::vector<std::string>{"t9"});
    REQUIRE(b.environment_ref == "2.0");
    REQUIRE(b.timeout == std::optional<std::chrono::seconds>{std::chrono::seconds(91)});

    REQUIRE(dataset.raw_records.size() == 2);
    REQUIRE(dataset.raw_records.at("org__a-1").find("\"org/a\"") != std::string::npos);
}

TEST_CASE("Malformed dataset lines name their location", "[loader][errors]") {
    TempDir dir;
    DatasetLoader loader;

    SECTION("invalid JSON") {
        const auto file = dir.write("bad.jsonl", R"({"instance_id": "x", "repo": "r", "base_commit": "c"})" "\n{oops\n");
        try {
            (void)loader.load_instances(file);
            FAIL("expected an error");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string{e.what()}.find("bad.jsonl:2") != std::string::npos);
        }
    }

    SECTION("missing field") {
        const auto file = dir.write("missing.jsonl", R"({"instance_id": "x", "repo": "r"})" "\n");
        REQUIRE_THROWS_AS(loader.load_instances(file), std::runtime_error);
    }

    SECTION("duplicate id") {
        const std::string line = R"({"instance_id": "x", "repo": "r", "base_commit": "c"})" "\n";
        const auto file = dir.write("dup.jsonl", line + line);
        REQUIRE_THROWS_AS(loader.load_instances(file), std::runtime_error);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(loader.load_instances("/nonexistent/patchgrade.jsonl"), std::runtime_error);
    }
}

TEST_CASE("Environment spec documents", "[loader][specs]") {
    TempDir dir;
    DatasetLoader loader;

    SECTION("version map with a lock file") {
        dir.write("requirements-1.0.lock", "numpy==1.25.2\n");
        const auto file = dir.write("specs.json", R"({
            "1.0": {"python": "3.9", "packages": "numpy pytest", "pip_packages": ["hypothesis"],
                    "requirements_lock": "requirements-1.0.lock", "install": "pip install -e .",
                    "pre_install": ["apt-get install -y gcc"], "eval_commands": ["export A=1"],
                    "test_cmd": "pytest -rA", "nano_cpus": 2},
            "2.0": {"python": 3.11, "test_cmd": "pytest", "frozen_requirements": "six==1.16.0\n"}
        })");
        const auto catalog = loader.load_environment_specs(file);
        REQUIRE_FALSE(catalog.shared.has_value());
        REQUIRE(catalog.by_version.size() == 2);

        const auto* one = catalog.find("1.0");
        REQUIRE(one != nullptr);
        REQUIRE(one->runtime_version == "3.9");
        REQUIRE(one->packages == std::vector<std::string>{"hypothesis", "numpy", "pytest"});
        REQUIRE(one->frozen_manifest.has_value());
        REQUIRE(one->frozen_manifest->name == "requirements-1.0.lock");
        REQUIRE(one->frozen_manifest->content == "numpy==1.25.2\n");
        REQUIRE(one->pre_install.size() == 1);
        REQUIRE(one->version_tag == "1.0");
        REQUIRE(catalog.warnings.size() == 1);

        const auto* two = catalog.find("2.0");
        REQUIRE(two->runtime_version == "3.11");
        REQUIRE(two->frozen_manifest->content == "six==1.16.0\n");

        REQUIRE(catalog.find("9.9") == nullptr);
    }

    SECTION("single spec applies to everything") {
        const auto file = dir.write("one.json", R"({"python": "3.10", "test_cmd": "pytest"})");
        const auto catalog = loader.load_environment_specs(file);
        REQUIRE(catalog.shared.has_value());
        REQUIRE(catalog.find("anything") != nullptr);
    }

    SECTION("lock file and inline manifest together are rejected") {
        const auto file = dir.write("both.json",
                                    R"({"python": "3.10", "test_cmd": "pytest", "requirements_lock": "r.lock",
                                        "frozen_requirements": "x==1"})");
        REQUIRE_THROWS_AS(loader.load_environment_specs(file), std::runtime_error);
    }

    SECTION("missing lock file") {
        const auto file = dir.write("nolock.json",
                                    R"({"python": "3.10", "test_cmd": "pytest", "requirements_lock": "absent.lock"})");
        REQUIRE_THROWS_AS(loader.load_environment_specs(file), std::runtime_error);
    }
}

TEST_CASE("Predictions map ids to candidate patches", "[loader]") {
    TempDir dir;
    const auto file = dir.write("preds.jsonl",
                                R"({"instance_id": "org__a-1", "model_patch": "MP1", "model_name_or_path": "m"})" "\n"
                                R"({"instance_id": "org__a-2", "model_patch": null})" "\n");
    const auto predictions = DatasetLoader{}.load_predictions(file);
    REQUIRE(predictions.size() == 2);
    REQUIRE(predictions.at("org__a-1") == "MP1");
    REQUIRE(predictions.at("org__a-2").empty());
}

TEST_CASE("Jobs pair instances with specs and predictions", "[loader][jobs]") {
    TempDir dir;
    const auto dataset = DatasetLoader{}.load_instances(dir.write("d.jsonl", kDataset));

    EnvironmentCatalog catalog;
    EnvironmentSpec one;
    one.test_cmd = "pytest one";
    one.version_tag = "1.0";
    EnvironmentSpec two;
    two.test_cmd = "pytest two";
    two.version_tag = "2.0";
    catalog.by_version = {{"1.0", one}, {"2.0", two}};

    SECTION("all instances, gold patches") {
        const auto jobs = assemble_jobs(dataset, catalog, {});
        REQUIRE(jobs.size() == 2);
        REQUIRE(jobs[0].environment.test_cmd == "pytest one");
        REQUIRE(jobs[1].environment.test_cmd == "pytest two");
        REQUIRE(jobs[0].instance.patch == "P1");
    }

    SECTION("selection and predictions") {
        const auto jobs = assemble_jobs(dataset, catalog, {{"org__a-2", "MP2"}}, {"org__a-2"});
        REQUIRE(jobs.size() == 1);
        REQUIRE(jobs[0].instance.id == "org__a-2");
        REQUIRE(jobs[0].instance.patch == "MP2");
    }

    SECTION("unknown ids are an error") {
        REQUIRE_THROWS_AS(assemble_jobs(dataset, catalog, {}, {"nope"}), std::runtime_error);
    }

    SECTION("an instance without a spec is an error") {
        catalog.by_version.erase("2.0");
        REQUIRE_THROWS_AS(assemble_jobs(dataset, catalog, {}), std::runtime_error);
    }
}

TEST_CASE("Inline spec_dict takes precedence over the catalog", "[loader][jobs]") {
    TempDir dir;
    const auto file = dir.write(
        "inline.jsonl",
        R"({"instance_id": "x", "repo": "r", "base_commit": "c", "version": "1.0", "spec_dict": {"python": "3.8", "test_cmd": "pytest inline"}})"
        "\n");
    const auto dataset = DatasetLoader{}.load_instances(file);
    REQUIRE(dataset.inline_specs.size() == 1);

    EnvironmentCatalog catalog;
    EnvironmentSpec shared;
    shared.test_cmd = "pytest shared";
    catalog.shared = shared;

    const auto jobs = assemble_jobs(dataset, catalog, {});
    REQUIRE(jobs[0].environment.test_cmd == "pytest inline");
    REQUIRE(jobs[0].environment.runtime_version == "3.8");
}
