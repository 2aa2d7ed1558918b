#include "executor.hpp"
#include <errno.h>
#include <future>
#include <mutex>
#include <set>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace safeexec;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class ExecutorTest : public ::testing::Test {
protected:
    filesystem::path root;
    configuration config;

    void SetUp() override {
        root = make_test_root();
        config = make_test_configuration(root);
    }

    void TearDown() override {
        // 每个分支结束后都不应留下工作目录
        EXPECT_EQ(count_directories_in_directory(root), 0);
        error_code ec;
        filesystem::remove_all(root, ec);
    }
};

TEST_F(ExecutorTest, SuccessRunsInWorkspace) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);

    EXPECT_CALL(box, invoke(_, _)).WillOnce(Invoke([&](const workspace &ws, const constraint_set &limits) {
        EXPECT_EQ(ws.dir().parent_path(), root);
        EXPECT_EQ(read_file_content(ws.dir() / "script.py"), "print('Hello World')");
        EXPECT_EQ(limits.timeout, chrono::seconds(10));
        EXPECT_EQ(limits.memory_limit, "128m");
        EXPECT_EQ(limits.process_limit, 64u);
        EXPECT_EQ(limits.output_limit, 128LL << 20);
        return make_result(0, "Hello World\n", "");
    }));

    outcome result = exec.execute("print('Hello World')");
    EXPECT_EQ(result.get_status(), status::SUCCESS);
    EXPECT_EQ(result.output(), "Hello World");
}

TEST_F(ExecutorTest, ProgramError) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).WillOnce(Return(make_result(1, "", "ValueError: bad\n")));

    outcome result = exec.execute("raise ValueError('bad')");
    EXPECT_EQ(result.get_status(), status::PROGRAM_ERROR);
    EXPECT_EQ(result.output(), "");
    EXPECT_EQ(result.error(), "ValueError: bad");
}

TEST_F(ExecutorTest, Timeout) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).WillOnce(Return(make_result(143, "", "", true)));

    outcome result = exec.execute("while True: pass");
    EXPECT_EQ(result.get_status(), status::TIMEOUT);
    EXPECT_EQ(result.error(), "timed out after 10 seconds");
}

TEST_F(ExecutorTest, OversizeCodeIsRejectedBeforeWorkspace) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).Times(0);

    outcome result = exec.execute(string(5001, 'a'));
    EXPECT_EQ(result.get_status(), status::VALIDATION_ERROR);
    EXPECT_EQ(result.error(), "code too long (max 5000)");

    result = exec.execute(string(11, 'a'), 10);
    EXPECT_EQ(result.get_status(), status::VALIDATION_ERROR);
    EXPECT_EQ(result.error(), "code too long (max 10)");
}

TEST_F(ExecutorTest, NonTextIsRejectedBeforeWorkspace) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).Times(0);

    outcome result = exec.execute("print('\xc3')");
    EXPECT_EQ(result.get_status(), status::VALIDATION_ERROR);
    EXPECT_EQ(result.error(), "code must be valid text");
}

TEST_F(ExecutorTest, WorkspaceFailureSkipsInvocation) {
    config.workspace_root = root / "missing";
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).Times(0);

    outcome result = exec.execute("print(1)");
    EXPECT_EQ(result.get_status(), status::INFRASTRUCTURE_ERROR);
    EXPECT_THAT(result.error(), HasSubstr("Unable to create workspace"));
}

TEST_F(ExecutorTest, LaunchFailureIsInfrastructureError) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).WillOnce(Throw(launch_error("docker", ENOENT)));

    outcome result = exec.execute("print(1)");
    EXPECT_EQ(result.get_status(), status::INFRASTRUCTURE_ERROR);
    EXPECT_EQ(result.error(), "Required tool not found: docker");
    EXPECT_EQ(get_status_class(result.get_status()), 500);
}

TEST_F(ExecutorTest, UnexpectedSandboxFailureIsInfrastructureError) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);
    EXPECT_CALL(box, invoke(_, _)).WillOnce(Throw(system_error(EMFILE, system_category(), "creating pipe for fd 1")));

    outcome result = exec.execute("print(1)");
    EXPECT_EQ(result.get_status(), status::INFRASTRUCTURE_ERROR);
    EXPECT_THAT(result.error(), HasSubstr("Internal error"));
    EXPECT_THAT(result.error(), HasSubstr("creating pipe for fd 1"));
}

TEST_F(ExecutorTest, WorkspaceRemovedDuringRunKeepsOutcome) {
    StrictMock<mock_sandbox> box;
    executor exec(config, box);

    // 用户程序结束时工作目录已经不存在，删除为空操作
    EXPECT_CALL(box, invoke(_, _)).WillOnce(Invoke([](const workspace &ws, const constraint_set &) {
        filesystem::remove_all(ws.dir());
        return make_result(0, "ok\n", "");
    }));

    outcome result = exec.execute("print('ok')");
    EXPECT_EQ(result.get_status(), status::SUCCESS);
    EXPECT_EQ(result.output(), "ok");
}

TEST_F(ExecutorTest, ConcurrentRunsUseDistinctWorkspaces) {
    mock_sandbox box;
    executor exec(config, box);

    mutex seen_mutex;
    set<string> seen;
    EXPECT_CALL(box, invoke(_, _)).Times(8).WillRepeatedly(Invoke([&](const workspace &ws, const constraint_set &) {
        {
            scoped_lock guard(seen_mutex);
            seen.insert(ws.run_id());
        }
        return make_result(0, read_file_content(ws.dir() / ws.script_name()) + "\n", "");
    }));

    vector<future<outcome>> futures;
    for (int i = 0; i < 8; ++i)
        futures.push_back(async(launch::async, [&exec, i] { return exec.execute(to_string(i)); }));
    for (int i = 0; i < 8; ++i) {
        outcome result = futures[i].get();
        EXPECT_EQ(result.get_status(), status::SUCCESS);
        EXPECT_EQ(result.output(), to_string(i));
    }
    EXPECT_EQ(seen.size(), 8u);
}
