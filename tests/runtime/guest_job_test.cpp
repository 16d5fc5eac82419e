#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "runtime/guest_job.hpp"
#include "runtime/guest_runner.hpp"
#include "safety/safety_policy.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/temp_dir.hpp"

namespace sandcell::runtime {
namespace {

namespace fs = std::filesystem;

class GuestJobTest : public ::testing::Test {
protected:
    GuestOutcome Run(const std::string& source,
                     bool trusted = false,
                     const nlohmann::json& snapshot = nlohmann::json::object(),
                     const safety::EnforcementConfig& config = safety::EnforcementConfig{}) {
        if (sandbox::ProcessRunner::FindExecutable("python3").empty()) {
            return GuestOutcome{};
        }
        job_.Prepare(source, safety::ResolvePolicy(config, trusted), trusted, snapshot);
        sandbox::ProcessSpec spec{};
        spec.argv = {"python3", job_.RunnerPath().string(), job_.JobPath().string()};
        spec.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}, {"PYTHONDONTWRITEBYTECODE", "1"}};
        spec.working_dir = dir_.Path();
        spec.capture_dir = dir_.Path();
        spec.timeout = std::chrono::seconds(30);
        last_ = sandbox::ProcessRunner::Run(spec);
        return job_.Collect();
    }

    void SkipWithoutPython() {
        if (sandbox::ProcessRunner::FindExecutable("python3").empty()) {
            GTEST_SKIP() << "python3 not available";
        }
    }

    sandbox::TempDir dir_{"sandcell-job-test"};
    GuestJob job_{dir_.Path() / "job"};
    sandbox::ProcessResult last_;
};

TEST_F(GuestJobTest, PrepareWritesJobFiles) {
    job_.Prepare("x = 1", safety::ResolvePolicy(safety::EnforcementConfig{}, false), false,
                 nlohmann::json{{"y", {{"encoding", "json"}, {"value", 2}}}});
    ASSERT_TRUE(fs::exists(job_.RunnerPath()));
    ASSERT_TRUE(fs::exists(job_.JobPath()));

    std::ifstream input(job_.JobPath());
    const auto job = nlohmann::json::parse(input);
    EXPECT_EQ(job["source"], "x = 1");
    EXPECT_FALSE(job["trusted"].get<bool>());
    EXPECT_EQ(job["snapshot_in"], kSnapshotInFileName);
    EXPECT_TRUE(job["policy"]["function_blocking_active"].get<bool>());

    std::ifstream snapshot(job_.Dir() / kSnapshotInFileName);
    EXPECT_EQ(nlohmann::json::parse(snapshot)["values"]["y"]["value"], 2);
}

TEST_F(GuestJobTest, CollectWithoutResultIsUnfinished) {
    job_.Prepare("x = 1", safety::EnforcementPolicy{}, false, nlohmann::json::object());
    const auto outcome = job_.Collect();
    EXPECT_FALSE(outcome.finished);
    EXPECT_FALSE(outcome.snapshot_values.has_value());
}

TEST_F(GuestJobTest, PrepareClearsPreviousOutput) {
    job_.Prepare("x = 1", safety::EnforcementPolicy{}, false, nlohmann::json::object());
    std::ofstream(job_.Dir() / kResultFileName) << R"({"ok": true})";
    EXPECT_TRUE(job_.Collect().finished);
    job_.Prepare("x = 2", safety::EnforcementPolicy{}, false, nlohmann::json::object());
    EXPECT_FALSE(job_.Collect().finished);
}

TEST_F(GuestJobTest, CollectToleratesMistypedFields) {
    job_.Prepare("x = 1", safety::EnforcementPolicy{}, false, nlohmann::json::object());
    std::ofstream(job_.Dir() / kResultFileName)
        << R"({"ok": "yes", "error": {"type": 3, "message": null, "traceback": ["t"]}})";
    const auto outcome = job_.Collect();
    EXPECT_TRUE(outcome.finished);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error_type, "");
    EXPECT_EQ(outcome.error_message, "");
    EXPECT_EQ(outcome.traceback, "");
}

TEST_F(GuestJobTest, RunnerReturnsLastExpressionAndSnapshot) {
    SkipWithoutPython();
    const auto outcome = Run("x = 21 * 2\nname = 'sandcell'\nprint('hi')\nx");
    ASSERT_TRUE(outcome.finished) << last_.error;
    EXPECT_TRUE(outcome.ok) << outcome.error_message;
    EXPECT_EQ(outcome.return_value.value_or(""), "42");
    EXPECT_EQ(last_.output, "hi\n");
    ASSERT_TRUE(outcome.snapshot_values.has_value());
    EXPECT_EQ((*outcome.snapshot_values)["x"]["encoding"], "json");
    EXPECT_EQ((*outcome.snapshot_values)["x"]["value"], 42);
    EXPECT_EQ((*outcome.snapshot_values)["name"]["value"], "sandcell");
}

TEST_F(GuestJobTest, RunnerRestoresSnapshot) {
    SkipWithoutPython();
    const nlohmann::json snapshot{
        {"counter", {{"encoding", "json"}, {"value", 5}}},
        {"math", {{"encoding", "module"}, {"value", "math"}}}
    };
    const auto outcome = Run("counter += 1\nint(math.sqrt(counter * 6))", false, snapshot);
    ASSERT_TRUE(outcome.finished) << last_.error;
    EXPECT_TRUE(outcome.ok) << outcome.error_message;
    EXPECT_EQ(outcome.return_value.value_or(""), "6");
    EXPECT_EQ((*outcome.snapshot_values)["counter"]["value"], 6);
}

TEST_F(GuestJobTest, RunnerReportsGuestErrors) {
    SkipWithoutPython();
    const auto outcome = Run("value = 1\nvalue / 0");
    ASSERT_TRUE(outcome.finished);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error_type, "ZeroDivisionError");
    EXPECT_NE(outcome.traceback.find("<guest>"), std::string::npos);
    EXPECT_EQ((*outcome.snapshot_values)["value"]["value"], 1);
}

TEST_F(GuestJobTest, RunnerBlocksLateBoundImports) {
    SkipWithoutPython();
    const auto outcome = Run("name = 'o' + 's'\nmodule = __import__(name)");
    ASSERT_TRUE(outcome.finished);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error_type, "ImportError");
    EXPECT_NE(outcome.error_message.find("blocked"), std::string::npos);
}

TEST_F(GuestJobTest, RunnerBlocksIndirectBuiltinCalls) {
    SkipWithoutPython();
    const auto outcome = Run("import builtins as b\nopener = getattr(b, 'op' + 'en')\nopener('/etc/hostname')",
                             false, nlohmann::json::object(),
                             [] {
                                 safety::EnforcementConfig config{};
                                 config.authorized_imports = std::vector<std::string>{"*"};
                                 return config;
                             }());
    ASSERT_TRUE(outcome.finished);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error_type, "PermissionError");
}

TEST_F(GuestJobTest, TrustedCodeRunsUnrestricted) {
    SkipWithoutPython();
    const auto outcome = Run("import os\nos.path.basename('/a/b')", true);
    ASSERT_TRUE(outcome.finished);
    EXPECT_TRUE(outcome.ok) << outcome.error_message;
    EXPECT_EQ(outcome.return_value.value_or(""), "'b'");
}

TEST(GuestRunnerScriptTest, ScriptIsPython) {
    const auto& script = GuestRunnerScript();
    EXPECT_NE(script.find("def main(argv):"), std::string::npos);
    EXPECT_NE(script.find(kResultFileName), std::string::npos);
}

}  // namespace
}  // namespace sandcell::runtime
