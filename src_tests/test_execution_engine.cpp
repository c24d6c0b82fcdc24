#include <catch2/catch.hpp>

#include "fake_runtime.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/execution_engine.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace patchgrade::harness;

namespace {

struct StateLog {
    std::vector<ContainerState> states;

    ContainerSession::Listener listener() {
        return [this](const std::string&, ContainerState s) { states.push_back(s); };
    }

    [[nodiscard]] std::size_t count(ContainerState s) const {
        std::size_t n = 0;
        for (auto x : states) {
            if (x == s) ++n;
        }
        return n;
    }
};

ExecutionRequest make_request() {
    ExecutionRequest r;
    r.image = "patchgrade-stage:final";
    r.patches = {"diff --git a/t.py b/t.py\n", "diff --git a/m.py b/m.py\n"};
    r.test_command = "bash /harness/run_tests.sh";
    r.timeout = std::chrono::seconds(60);
    r.container_name = "eval-1";
    return r;
}

bool is_patch(const std::string& script) {
    return script.find("git apply") != std::string::npos;
}

}  // namespace

TEST_CASE("Engine applies patches in order and runs the tests", "[engine]") {
    fakes::FakeRuntime runtime;
    runtime.files["/harness/report.json"] = R"({"a": "passed"})";
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) {
        if (is_patch(script)) return fakes::ok("Applied patch cleanly.\n");
        return CommandResult{1, "1 failed\n", "warn\n", false};
    };
    StateLog log;
    ExecutionEngine engine(runtime, ExecutionEngine::Config{.listener = log.listener()});

    const auto result = engine.run(make_request());

    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stdout_text == "1 failed\n");
    REQUIRE(result.stderr_text == "warn\n");
    REQUIRE(result.structured_report == std::optional<std::string>{R"({"a": "passed"})"});
    REQUIRE(result.final_state == ContainerState::Completed);
    REQUIRE(result.patch_log.find("Applied patch cleanly.") != std::string::npos);

    const auto execs = runtime.execs();
    REQUIRE(execs.size() == 3);
    REQUIRE(execs[0].script.find("patch_0.diff") != std::string::npos);
    REQUIRE(execs[1].script.find("patch_1.diff") != std::string::npos);
    REQUIRE(execs[2].script == "bash /harness/run_tests.sh");

    const auto written = runtime.written();
    REQUIRE(written.size() == 2);

    SECTION("execution container has no network") {
        const auto created = runtime.created();
        REQUIRE(created.size() == 1);
        REQUIRE(created.front().network_disabled);
        REQUIRE(created.front().image == "patchgrade-stage:final");
        REQUIRE(created.front().name == "eval-1");
    }

    SECTION("the container is torn down exactly once") {
        REQUIRE(runtime.removed().size() == 1);
        REQUIRE(runtime.live_containers() == 0);
        REQUIRE(log.count(ContainerState::TornDown) == 1);
        REQUIRE(log.states == std::vector<ContainerState>{ContainerState::Created, ContainerState::Patching,
                                                          ContainerState::Running, ContainerState::Completed,
                                                          ContainerState::TornDown});
    }
}

TEST_CASE("Blank patches are skipped", "[engine]") {
    fakes::FakeRuntime runtime;
    ExecutionEngine engine(runtime);
    auto request = make_request();
    request.patches = {"", "  \n"};
    const auto result = engine.run(request);
    REQUIRE(runtime.execs().size() == 1);
    REQUIRE(runtime.written().empty());
    REQUIRE_FALSE(result.structured_report.has_value());
}

TEST_CASE("A patch that does not apply stops the run", "[engine][errors]") {
    fakes::FakeRuntime runtime;
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) {
        if (script.find("patch_1.diff") != std::string::npos) return fakes::failed(1, "error: patch failed: m.py:3");
        return fakes::ok();
    };
    StateLog log;
    ExecutionEngine engine(runtime, ExecutionEngine::Config{.listener = log.listener()});

    try {
        (void)engine.run(make_request());
        FAIL("expected PatchApplyError");
    } catch (const PatchApplyError& e) {
        REQUIRE(e.patch_index() == 1);
        REQUIRE(e.log_excerpt().find("patch failed") != std::string::npos);
    }

    REQUIRE(runtime.execs().size() == 2);   // test command never ran
    REQUIRE(runtime.reads() == 0);
    REQUIRE(runtime.live_containers() == 0);
    REQUIRE(log.count(ContainerState::PatchFailed) == 1);
    REQUIRE(log.count(ContainerState::TornDown) == 1);
}

TEST_CASE("A test command over budget is killed", "[engine][timeout]") {
    fakes::FakeRuntime runtime;
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) {
        if (is_patch(script)) return fakes::ok();
        return fakes::timed_out("collected 3 items\n");
    };
    StateLog log;
    ExecutionEngine engine(runtime, ExecutionEngine::Config{.listener = log.listener()});

    try {
        (void)engine.run(make_request());
        FAIL("expected TimeoutError");
    } catch (const TimeoutError& e) {
        REQUIRE(e.partial_stdout() == "collected 3 items\n");
        REQUIRE(e.timeout() == std::chrono::seconds(60));
    }
    REQUIRE(runtime.killed().size() == 1);
    REQUIRE(runtime.live_containers() == 0);
    REQUIRE(log.count(ContainerState::TimedOut) == 1);
    REQUIRE(log.count(ContainerState::TornDown) == 1);
    REQUIRE(log.count(ContainerState::InternalError) == 0);
}

TEST_CASE("The timeout budget covers patching and testing together", "[engine][timeout]") {
    fakes::FakeRuntime runtime;
    std::vector<std::chrono::milliseconds> budgets;
    runtime.on_exec = [&](const std::string&, const std::string&, std::chrono::milliseconds timeout) {
        budgets.push_back(timeout);
        return fakes::ok();
    };
    ExecutionEngine engine(runtime);
    (void)engine.run(make_request());

    REQUIRE(budgets.size() == 3);
    for (const auto& b : budgets) {
        REQUIRE(b <= std::chrono::seconds(60));
    }
    REQUIRE(budgets[2] <= budgets[0]);
}

TEST_CASE("Runtime failures surface as internal errors", "[engine][errors]") {
    fakes::FakeRuntime runtime;
    runtime.on_exec = [](const std::string&, const std::string& script, std::chrono::milliseconds) -> CommandResult {
        if (is_patch(script)) return fakes::ok();
        throw InternalError("daemon went away");
    };
    StateLog log;
    ExecutionEngine engine(runtime, ExecutionEngine::Config{.listener = log.listener()});

    REQUIRE_THROWS_AS(engine.run(make_request()), InternalError);
    REQUIRE(log.count(ContainerState::InternalError) == 1);
    REQUIRE(log.count(ContainerState::TornDown) == 1);
    REQUIRE(runtime.live_containers() == 0);
}

TEST_CASE("Container creation failure leaves nothing behind", "[engine][errors]") {
    fakes::FakeRuntime runtime;
    runtime.fail_create = true;
    ExecutionEngine engine(runtime);
    REQUIRE_THROWS_AS(engine.run(make_request()), InternalError);
    REQUIRE(runtime.removed().empty());
}

TEST_CASE("Session rejects out-of-order transitions", "[engine][session]") {
    fakes::FakeRuntime runtime;
    const auto id = runtime.create_container(ContainerOptions{});
    StateLog log;
    {
        ContainerSession session(runtime, id, log.listener(), Logger::null());
        REQUIRE_THROWS_AS(session.transition(ContainerState::Completed), InternalError);
        session.transition(ContainerState::Patching);
        session.transition(ContainerState::Running);
        session.transition(ContainerState::Completed);
        REQUIRE_THROWS_AS(session.transition(ContainerState::Running), InternalError);

        session.fail();   // terminal already, no change
        REQUIRE(session.state() == ContainerState::Completed);

        session.teardown();
        session.teardown();
        REQUIRE(session.state() == ContainerState::TornDown);
    }
    REQUIRE(runtime.removed().size() == 1);
    REQUIRE(log.count(ContainerState::TornDown) == 1);
}

TEST_CASE("Teardown tolerates a failing remove", "[engine][session]") {
    fakes::FakeRuntime runtime;
    runtime.fail_remove = true;
    ExecutionEngine engine(runtime);
    const auto result = engine.run(make_request());
    REQUIRE(result.final_state == ContainerState::Completed);
    REQUIRE(runtime.removed().size() == 1);
}

TEST_CASE("Container states have stable names", "[engine]") {
    REQUIRE(to_string(ContainerState::Created) == "CREATED");
    REQUIRE(to_string(ContainerState::PatchFailed) == "PATCH_FAILED");
    REQUIRE(to_string(ContainerState::TornDown) == "TORN_DOWN");
}
