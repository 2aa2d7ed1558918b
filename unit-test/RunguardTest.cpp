#include "runguard.hpp"
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>
#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace safeexec;

static runguard_options shell(const string &script, chrono::milliseconds wall_limit = chrono::milliseconds(0)) {
    runguard_options opt;
    opt.command = {"/bin/sh", "-c", script};
    opt.wall_limit = wall_limit;
    return opt;
}

TEST(RunguardTest, CapturesStreams) {
    runguard_result result = runit(shell("echo hello; echo world >&2"));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_FALSE(result.deadline_exceeded);
    EXPECT_EQ(result.stdout_content, "hello\n");
    EXPECT_EQ(result.stderr_content, "world\n");
    EXPECT_GE(result.wall_time, 0);
}

TEST(RunguardTest, ReportsExitCode) {
    runguard_result result = runit(shell("exit 3"));
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_FALSE(result.deadline_exceeded);

    result = runit(shell("exit 124", chrono::seconds(5)));
    EXPECT_EQ(result.exitcode, 124);
    EXPECT_FALSE(result.deadline_exceeded);
}

TEST(RunguardTest, ReportsSignal) {
    runguard_result result = runit(shell("kill -9 $$"));
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.exitcode, 128 + SIGKILL);
    EXPECT_FALSE(result.deadline_exceeded);
}

TEST(RunguardTest, DoesNotWaitForStdin) {
    runguard_result result = runit(shell("cat; echo done", chrono::seconds(5)));
    EXPECT_FALSE(result.deadline_exceeded);
    EXPECT_EQ(result.stdout_content, "done\n");
}

TEST(RunguardTest, KillsOnDeadline) {
    runguard_result result = runit(shell("echo started; while true; do :; done", chrono::milliseconds(500)));
    EXPECT_TRUE(result.deadline_exceeded);
    EXPECT_EQ(result.signal, SIGTERM);
    EXPECT_EQ(result.stdout_content, "started\n");
    EXPECT_GE(result.wall_time, 0.5);
    EXPECT_LT(result.wall_time, 3);
}

TEST(RunguardTest, KillsProcessGroupOnDeadline) {
    // 子进程立即退出，但后台的孙进程仍然持有输出管道
    runguard_result result = runit(shell("(sleep 30; echo late) & exit 0", chrono::milliseconds(500)));
    EXPECT_TRUE(result.deadline_exceeded);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_content, "");
    EXPECT_LT(result.wall_time, 3);
}

TEST(RunguardTest, TruncatesOutput) {
    runguard_options opt = shell("head -c 100000 /dev/zero; echo tail >&2");
    opt.stream_size = 1000;
    runguard_result result = runit(opt);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_content.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stderr_content, "tail\n");
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(RunguardTest, MissingBinaryIsLaunchError) {
    runguard_options opt;
    opt.command = {"safeexec-no-such-binary", "--version"};
    try {
        runit(opt);
        FAIL() << "missing binary should not be executed";
    } catch (launch_error &ex) {
        EXPECT_EQ(ex.binary, "safeexec-no-such-binary");
        EXPECT_STREQ(ex.what(), "Required tool not found: safeexec-no-such-binary");
    }
}

TEST(RunguardTest, EmptyCommandIsRejected) {
    EXPECT_THROW(runit(runguard_options()), invalid_argument);
}

TEST(RunguardDeathTest, KillsCommandWhenSupervisionFails) {
    filesystem::path marker = filesystem::temp_directory_path() / ("safeexec-runguard-marker-" + to_string(getpid()));
    filesystem::remove(marker);

    EXPECT_EXIT({
        // 限制地址空间，保存大量输出时 runit 会抛出 bad_alloc
        rlimit limit;
        limit.rlim_cur = 300ULL << 20;
        limit.rlim_max = 300ULL << 20;
        setrlimit(RLIMIT_AS, &limit);

        runguard_options opt = shell("head -c 1000000000 /dev/zero; sleep 2; touch " + marker.string(), chrono::seconds(10));
        try {
            runit(opt);
        } catch (exception &) {
            // 子进程如果还活着，会在 2s 后创建 marker
            this_thread::sleep_for(chrono::seconds(3));
            _exit(filesystem::exists(marker) ? 1 : 0);
        }
        _exit(2);
    }, ::testing::ExitedWithCode(0), "");

    filesystem::remove(marker);
}
