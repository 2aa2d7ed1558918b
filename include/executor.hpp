#pragma once

#include <string>
#include "config.hpp"
#include "outcome.hpp"
#include "sandbox/sandbox.hpp"
#include "workspace.hpp"

namespace safeexec {

/**
 * @brief 将一份不可信的代码变成一次隔离的、有资源和时间限制的运行，并给出分类后的结果
 *
 * 每次运行的状态变化：
 * VALIDATING → WORKSPACE_READY → INVOKING → CLASSIFIED → CLEANED_UP
 * 1. VALIDATING: 检查代码，不合法时直接返回 VALIDATION_ERROR，此时没有分配任何资源
 * 2. WORKSPACE_READY: 创建工作目录，失败时返回 INFRASTRUCTURE_ERROR，不再运行沙箱
 * 3. INVOKING: 运行沙箱，沙箱无法启动时返回 INFRASTRUCTURE_ERROR，不经过分类
 * 4. CLASSIFIED: 根据运行结果分类
 * 5. CLEANED_UP: 无论结果如何都删除工作目录，删除失败不影响已经得到的结果
 *
 * executor 构造后不再修改，execute 可以被多个线程同时调用，
 * 每次运行有自己的 id、工作目录和容器，相互之间不共享任何可变状态。
 */
struct executor {
    /**
     * @param config 已经通过 validate_configuration 检查的配置
     * @param box 运行用户代码的沙箱，生命周期必须长于 executor
     */
    executor(configuration config, const sandbox &box);

    /**
     * @brief 使用配置中的最大代码长度运行代码
     */
    outcome execute(const std::string &code) const;

    /**
     * @brief 运行代码并返回唯一的结果，不会抛出异常
     * @param code 用户代码
     * @param max_length 允许的最大代码长度（字符数）
     */
    outcome execute(const std::string &code, size_t max_length) const;

private:
    const configuration config;
    const sandbox &box;
    const workspace_manager workspaces;

    outcome run(const submission &submit) const;
};

}  // namespace safeexec
