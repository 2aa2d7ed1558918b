#include "sandbox/constraints.hpp"
#include <algorithm>
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

using namespace std;
using namespace safeexec;

TEST(ContainerCommandTest, BuildsRunCommand) {
    configuration config;
    config.run_user = "1000:1000";
    validate_configuration(config);

    vector<string> argv = container_command("docker", "safe-python-runner:latest")
                              .name("safeexec-1234")
                              .constraints(constraint_set::from_configuration(config))
                              .mount_read_only("/tmp/safeexec-1234", "/app")
                              .entry({"python", "/app/script.py"})
                              .build();

    vector<string> expected = {
        "docker", "run", "--rm",
        "--name", "safeexec-1234",
        "--network", "none",
        "--memory", "128m",
        "--memory-swap", "128m",
        "--pids-limit", "64",
        "--read-only",
        "--security-opt", "no-new-privileges:true",
        "--cap-drop=ALL",
        "--user", "1000:1000",
        "--volume", "/tmp/safeexec-1234:/app:ro",
        "safe-python-runner:latest",
        "python", "/app/script.py"};
    EXPECT_EQ(argv, expected);
}

TEST(ContainerCommandTest, OmitsUnsetOptions) {
    vector<string> argv = container_command("podman", "runner")
                              .entry({"python", "/app/script.py"})
                              .build();
    EXPECT_EQ(argv, (vector<string>{"podman", "run", "--rm", "runner", "python", "/app/script.py"}));
}

TEST(ContainerCommandTest, ConstraintsFromConfiguration) {
    configuration config;
    config.timeout_seconds = 3;
    config.memory_limit = "64m";
    config.process_limit = 16;
    validate_configuration(config);

    constraint_set limits = constraint_set::from_configuration(config);
    EXPECT_EQ(limits.timeout, chrono::seconds(3));
    EXPECT_EQ(limits.memory_limit, "64m");
    EXPECT_EQ(limits.process_limit, 16u);
    EXPECT_EQ(limits.output_limit, 64LL << 20);
    EXPECT_TRUE(limits.network_disabled);
    EXPECT_TRUE(limits.read_only_root);
    EXPECT_TRUE(limits.drop_capabilities);
    EXPECT_TRUE(limits.no_new_privileges);
    EXPECT_TRUE(limits.user.empty());
}

TEST(ContainerCommandTest, KillCommand) {
    EXPECT_EQ(container_kill_command("docker", "safeexec-1234"),
              (vector<string>{"docker", "kill", "safeexec-1234"}));
}

TEST(ContainerCommandTest, SandboxCommandForWorkspace) {
    configuration config;
    config.interpreter = {"python3", "-I"};
    validate_configuration(config);
    container_sandbox box(config);

    // 目录不存在，析构时的删除是空操作
    workspace ws("abcd", "/nonexistent/safeexec-abcd", "script.py");
    vector<string> argv = box.command_for(ws, constraint_set::from_configuration(config));

    ASSERT_GE(argv.size(), 6u);
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");
    EXPECT_EQ(argv[3], "--name");
    EXPECT_EQ(argv[4], "safeexec-abcd");
    EXPECT_NE(find(argv.begin(), argv.end(), "/nonexistent/safeexec-abcd:/app:ro"), argv.end());
    EXPECT_EQ(vector<string>(argv.end() - 4, argv.end()),
              (vector<string>{"safe-python-runner:latest", "python3", "-I", "/app/script.py"}));
}
