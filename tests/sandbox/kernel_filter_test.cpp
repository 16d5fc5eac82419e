#include <gtest/gtest.h>

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

#include <unistd.h>

#include <linux/seccomp.h>

#include "sandbox/kernel_filter.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/temp_dir.hpp"

namespace sandcell::sandbox {
namespace {

namespace fs = std::filesystem;

TEST(KernelFilterTest, ProgramEndsInAllowAndGrowsWithoutNetwork) {
    KernelFilterSpec open_spec{};
    open_spec.allow_network = true;
    KernelFilterSpec closed_spec{};
    closed_spec.allow_network = false;

    const KernelFilter open_filter(open_spec);
    const KernelFilter closed_filter(closed_spec);
    ASSERT_FALSE(open_filter.Program().empty());
    EXPECT_EQ(closed_filter.Program().size(), open_filter.Program().size() + 5);
    EXPECT_EQ(open_filter.Program().back().k, static_cast<unsigned>(SECCOMP_RET_ALLOW));
}

class KernelFilterRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!KernelFilter::SeccompAvailable() || !KernelFilter::NativeArchitectureSupported()) {
            GTEST_SKIP() << "seccomp filtering not available";
        }
        if (ProcessRunner::FindExecutable("sh").empty()) {
            GTEST_SKIP() << "sh not available";
        }
    }

    ProcessResult RunFiltered(const KernelFilter& filter, const std::string& script) const {
        ProcessSpec spec{};
        spec.argv = {"sh", "-c", script};
        spec.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}};
        spec.working_dir = allowed_.Path();
        spec.capture_dir = allowed_.Path();
        spec.timeout = std::chrono::seconds(10);
        spec.kernel_filter = &filter;
        return ProcessRunner::Run(spec);
    }

    KernelFilterSpec BaseSpec() const {
        KernelFilterSpec spec{};
        spec.read_paths = {"/"};
        spec.write_paths = {allowed_.Path().string(), "/dev/null"};
        return spec;
    }

    TempDir allowed_{"sandcell-filter-allowed"};
    TempDir other_{"sandcell-filter-other"};
};

TEST_F(KernelFilterRunTest, PermittedWorkRuns) {
    const KernelFilter filter(BaseSpec());
    const auto result = RunFiltered(filter, "echo ok > note.txt && cat note.txt");
    EXPECT_TRUE(result.launch_error.empty()) << result.launch_error;
    EXPECT_EQ(result.exit_code, 0) << result.error;
    EXPECT_EQ(result.output, "ok\n");
}

TEST_F(KernelFilterRunTest, WritesOutsideAllowedPathsFail) {
    const KernelFilter filter(BaseSpec());
    if (!filter.LandlockActive()) {
        GTEST_SKIP() << "Landlock not available";
    }
    const auto target = (other_.Path() / "escape.txt").string();
    const auto result = RunFiltered(filter, "echo x > '" + target + "'");
    EXPECT_NE(result.exit_code, 0);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(KernelFilterRunTest, FileSizeLimitApplies) {
    auto spec = BaseSpec();
    spec.max_file_bytes = 1024;
    const KernelFilter filter(spec);
    const auto result = RunFiltered(filter, "head -c 4096 /dev/zero > big.bin");
    EXPECT_NE(result.exit_code, 0);
    std::error_code ec;
    EXPECT_LE(fs::file_size(allowed_.Path() / "big.bin", ec), 1024u);
}

TEST(KernelFilterTest, ProcessBudgetIsOnTopOfExistingTasks) {
    const auto existing = KernelFilter::CountUserTasks(::getuid());
    EXPECT_GE(existing, 1u);

    KernelFilterSpec spec{};
    spec.max_processes = 8;
    const KernelFilter limited(spec);
    EXPECT_GE(limited.ProcessLimit(), existing + 8);

    const KernelFilter unlimited(KernelFilterSpec{});
    EXPECT_EQ(unlimited.ProcessLimit(), 0u);
}

TEST_F(KernelFilterRunTest, SmallProcessBudgetStillRunsPipelines) {
    // Busy siblings of the same user must not eat into the child's budget.
    std::mutex mutex;
    std::condition_variable released;
    bool done = false;
    std::vector<std::thread> siblings;
    for (int i = 0; i < 16; ++i) {
        siblings.emplace_back([&] {
            std::unique_lock<std::mutex> lock(mutex);
            released.wait(lock, [&] { return done; });
        });
    }

    auto spec = BaseSpec();
    spec.max_processes = 8;
    const KernelFilter filter(spec);
    const auto result = RunFiltered(filter, "echo one two | tr ' ' '\\n' | sort | head -n 1");

    {
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
    }
    released.notify_all();
    for (auto& sibling : siblings) {
        sibling.join();
    }

    EXPECT_TRUE(result.launch_error.empty()) << result.launch_error;
    EXPECT_EQ(result.exit_code, 0) << result.error;
    EXPECT_EQ(result.output, "one\n");
}

TEST_F(KernelFilterRunTest, NetworkSocketsAreDenied) {
    if (ProcessRunner::FindExecutable("python3").empty()) {
        GTEST_SKIP() << "python3 not available";
    }
    const KernelFilter filter(BaseSpec());
    const auto result = RunFiltered(filter, "python3 -c 'import socket; socket.socket(socket.AF_INET)'");
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.error.find("PermissionError"), std::string::npos) << result.error;
}

}  // namespace
}  // namespace sandcell::sandbox
