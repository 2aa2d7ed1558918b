#pragma once

#include "config.hpp"
#include "runguard.hpp"
#include "sandbox/constraints.hpp"
#include "workspace.hpp"

namespace safeexec {

/**
 * @brief 表示一种隔离运行用户代码的方式
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief 在隔离环境中运行工作目录中的用户代码
     * 工作目录以只读方式提供给用户程序，运行时间受宿主机的时钟时间限制约束。
     * @param ws 本次运行的工作目录
     * @param limits 本次运行的限制条件
     * @return 运行结果，超时由 runguard_result::deadline_exceeded 标记
     * @throw launch_error 沙箱程序无法启动
     */
    virtual runguard_result invoke(const workspace &ws, const constraint_set &limits) const = 0;
};

/**
 * @brief 通过容器运行时（默认为 docker）运行用户代码
 * 容器运行时本身被视为不可信的依赖，因此超时由 runguard 在宿主机上强制执行，
 * 超时后再通过运行时强制停止容器。
 */
struct container_sandbox : sandbox {
    explicit container_sandbox(const configuration &config);

    runguard_result invoke(const workspace &ws, const constraint_set &limits) const override;

    /**
     * @brief 构造本次运行的完整命令行（不启动进程）
     */
    std::vector<std::string> command_for(const workspace &ws, const constraint_set &limits) const;

private:
    std::string runtime;
    std::string image;
    std::string mount_point;
    std::vector<std::string> interpreter;

    void kill_container(const std::string &container_name) const;
};

}  // namespace safeexec
