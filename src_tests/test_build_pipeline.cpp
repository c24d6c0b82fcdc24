#include <catch2/catch.hpp>

#include "fake_runtime.hpp"
#include "patchgrade_harness/build_pipeline.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/spec_resolver.hpp"

#include <memory>
#include <string>

using namespace patchgrade::harness;

namespace {

Instance make_instance() {
    Instance i;
    i.id = "org__proj-7";
    i.repo = "org/proj";
    i.base_commit = "0123abcd";
    i.expected.fail_to_pass = {"tests/test_x.py::test_new"};
    return i;
}

EnvironmentSpec make_spec() {
    EnvironmentSpec s;
    s.runtime_version = "3.11";
    s.packages = {"pytest"};
    s.install = "pip install -e .";
    s.test_cmd = "pytest";
    return s;
}

std::size_t stages_with_commands(const BuildPlan& plan) {
    std::size_t n = 0;
    for (const auto& s : plan.stages) {
        if (!s.empty()) ++n;
    }
    return n;
}

}  // namespace

TEST_CASE("Pipeline builds every stage and chains images", "[pipeline]") {
    fakes::FakeRuntime runtime;
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());

    const auto image = pipeline.build(plan);
    const auto commits = runtime.commits();
    REQUIRE(commits.size() == stages_with_commands(plan));
    REQUIRE(image == commits.back());
    REQUIRE(image == pipeline.image_tag(plan.stages.back().hash));
    REQUIRE(runtime.live_containers() == 0);

    SECTION("each stage starts from its parent") {
        const auto created = runtime.created();
        REQUIRE(created.front().image == plan.base_image);
        for (std::size_t i = 1; i < created.size(); ++i) {
            REQUIRE(created[i].image == commits[i - 1]);
        }
    }

    SECTION("isolated stages run without network") {
        const auto created = runtime.created();
        REQUIRE_FALSE(created.front().network_disabled);
        REQUIRE(created.back().network_disabled);
    }
}

TEST_CASE("Second build of an unchanged plan commits nothing", "[pipeline]") {
    fakes::FakeRuntime runtime;
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());

    const auto first = pipeline.build(plan);
    const auto commits_after_first = runtime.commits().size();
    const auto second = pipeline.build(plan);

    REQUIRE(second == first);
    REQUIRE(runtime.commits().size() == commits_after_first);
    REQUIRE(pipeline.stats().commits == commits_after_first);
    REQUIRE(pipeline.stats().cache_hits == stages_with_commands(plan));
}

TEST_CASE("Images left by an earlier run are found through the local probe", "[pipeline]") {
    fakes::FakeRuntime runtime;
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());
    {
        ImageCache cache;
        BuildPipeline pipeline(runtime, cache);
        (void)pipeline.build(plan);
    }
    const auto committed = runtime.commits().size();

    ImageCache::Config config;
    config.local_probe = BuildPipeline::local_probe(runtime);
    ImageCache fresh(config);
    BuildPipeline pipeline(runtime, fresh);
    (void)pipeline.build(plan);
    REQUIRE(runtime.commits().size() == committed);
}

TEST_CASE("A failing stage raises BuildError and removes its container", "[pipeline][errors]") {
    fakes::FakeRuntime runtime;
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) {
        if (script.find("--no-deps") != std::string::npos) {
            return fakes::failed(2, "error: setup.py not found");
        }
        return fakes::ok();
    };
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());

    try {
        (void)pipeline.build(plan);
        FAIL("expected BuildError");
    } catch (const BuildError& e) {
        REQUIRE(e.stage() == "install");
        REQUIRE(e.exit_code() == 2);
        REQUIRE(e.log_excerpt().find("setup.py not found") != std::string::npos);
    }
    REQUIRE(runtime.live_containers() == 0);
    REQUIRE_FALSE(cache.lookup(plan.stage("install")->hash).has_value());
    REQUIRE(cache.lookup(plan.stage("git_checkout")->hash).has_value());

    SECTION("the failure is not retried within the run") {
        const auto execs = runtime.execs().size();
        REQUIRE_THROWS_AS(pipeline.build(plan), BuildError);
        REQUIRE(runtime.execs().size() == execs);
    }
}

TEST_CASE("A timed-out stage command is a build failure", "[pipeline][errors]") {
    fakes::FakeRuntime runtime;
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) {
        if (script.find("git clone") != std::string::npos) return fakes::timed_out("Cloning into...");
        return fakes::ok();
    };
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());
    REQUIRE_THROWS_AS(pipeline.build(plan), BuildError);
    REQUIRE(runtime.live_containers() == 0);
}

TEST_CASE("Stages without commands reuse the parent image", "[pipeline]") {
    fakes::FakeRuntime runtime;
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());

    (void)pipeline.build(plan);
    const auto* pre = plan.stage("pre_install");
    REQUIRE(pre->commands.empty());
    REQUIRE(cache.lookup(pre->hash) == cache.lookup(plan.stage("clone")->hash));
}

TEST_CASE("Registry hits skip container work", "[pipeline][registry]") {
    fakes::FakeRuntime runtime;
    auto registry = std::make_shared<fakes::FakeRegistry>();
    const auto plan = SpecResolver{}.resolve(make_instance(), make_spec());
    registry->remote[plan.stages.back().hash] = "remote:final";

    ImageCache::Config config;
    config.registry = registry;
    ImageCache cache(config);
    BuildPipeline pipeline(runtime, cache);

    const auto image = pipeline.build(plan);
    REQUIRE(image == "remote:final");
    REQUIRE(registry->pushed.size() == runtime.commits().size());
}

TEST_CASE("Stage files are written into the build container", "[pipeline]") {
    fakes::FakeRuntime runtime;
    ImageCache cache;
    BuildPipeline pipeline(runtime, cache);
    auto instance = make_instance();
    for (int i = 0; i < 3000; ++i) {
        instance.expected.pass_to_pass.push_back("tests/test_x.py::test_generated_case_" + std::to_string(i));
    }
    const auto plan = SpecResolver{}.resolve(instance, make_spec());

    (void)pipeline.build(plan);
    const auto& script = plan.stage("test_cmd")->files.front();
    bool found = false;
    for (const auto& [key, content] : runtime.written()) {
        if (key.find(":" + script.path) != std::string::npos) {
            REQUIRE(content == script.content);
            found = true;
        }
    }
    REQUIRE(found);
    REQUIRE(cache.lookup(plan.stage("eval_commands")->hash) == pipeline.image_tag(plan.stage("eval_commands")->hash));
    for (const auto& call : runtime.execs()) {
        REQUIRE(call.script.find("test_generated_case_") == std::string::npos);
    }
}
