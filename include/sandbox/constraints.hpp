#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"

namespace safeexec {

/**
 * @brief 施加在一次运行上的限制
 * 每次运行各自构造，由沙箱独立执行，不在多次运行之间共享。
 */
struct constraint_set {
    /**
     * @brief 内存限制，格式同 configuration::memory_limit
     * 同时作为内存加交换区的限制，避免通过交换区绕过内存限制
     */
    std::string memory_limit;

    /**
     * @brief 进程（线程）数限制
     */
    size_t process_limit = 0;

    /**
     * @brief 宿主机时钟时间限制
     */
    std::chrono::seconds timeout{0};

    /**
     * @brief 每个输出流保存的最大字节数
     */
    int64_t output_limit = -1;

    bool network_disabled = true;
    bool read_only_root = true;
    bool drop_capabilities = true;
    bool no_new_privileges = true;

    /**
     * @brief 运行用户，为空时使用镜像默认用户
     */
    std::string user;

    static constraint_set from_configuration(const configuration &config);
};

/**
 * @brief 容器运行时的命令行构造器
 * 把类型化的限制条件序列化为容器运行时（docker 兼容的命令行）参数，
 * 所有参数只在这里拼接，不经过 shell，避免转义导致的安全问题。
 * @code{.cpp}
 *     auto argv = container_command("docker", "safe-python-runner:latest")
 *                     .name("safeexec-1234")
 *                     .constraints(constraint_set::from_configuration(config))
 *                     .mount_read_only("/tmp/safeexec-1234", "/app")
 *                     .entry({"python", "/app/script.py"})
 *                     .build();
 * @endcode
 */
struct container_command {
    container_command(std::string runtime, std::string image);

    container_command &name(const std::string &container_name);
    container_command &constraints(const constraint_set &limits);
    container_command &mount_read_only(const std::filesystem::path &host, const std::string &guest);
    container_command &entry(const std::vector<std::string> &command);

    /**
     * @return 完整的参数列表，argv[0] 为容器运行时
     */
    std::vector<std::string> build() const;

private:
    std::string runtime;
    std::string image;
    std::string container_name;
    std::vector<std::string> options;
    std::vector<std::string> entry_command;
};

/**
 * @brief 强制停止容器的命令
 */
std::vector<std::string> container_kill_command(const std::string &runtime, const std::string &container_name);

}  // namespace safeexec
