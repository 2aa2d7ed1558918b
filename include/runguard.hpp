#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace safeexec {

struct runguard_options {
    /**
     * @brief 要执行的命令，command[0] 按照 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 时钟时间限制，为 0 时不限制
     */
    std::chrono::milliseconds wall_limit{0};

    /**
     * @brief 每个输出流最多保存的字节数，超出部分读出后丢弃，小于 0 时不限制
     */
    int64_t stream_size = -1;
};

struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 进程的返回值
     * 如果进程因为信号终止，返回值为 128 + 信号值
     */
    int exitcode = -1;

    /**
     * @brief 终止进程的信号，进程正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 是否因为超出时钟时间限制而被 runguard 杀死
     * 这是超时的唯一判定依据，与进程的返回值无关
     */
    bool deadline_exceeded = false;

    std::string stdout_content;
    std::string stderr_content;

    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

/**
 * @brief 在宿主机上运行命令，并施加时钟时间限制
 * 这个函数可以被多个线程并发调用，不使用信号处理函数，也不修改进程的全局状态。
 * 1. 创建带有 O_CLOEXEC 的管道，避免其他线程产生的子进程继承管道导致读不到 EOF
 * 2. 调用 fork 创建子进程
 *    1. 子进程通过 setsid 分离到独立的进程组，以便通过一个信号杀死整个进程树
 *    2. 将管道连接到 stdout/stderr，stdin 重定向到 /dev/null
 *    3. 调用 execvp，失败时通过另一个管道把 errno 发送给父进程
 * 3. 父进程读取 exec 的状态，exec 失败时抛出 launch_error
 * 4. 父进程通过 poll 读取子进程的输出并等待子进程结束，直到时钟时间用尽
 * 5. 超时时先向进程组发送 SIGTERM，等待 0.1s 后发送 SIGKILL，并回收子进程
 * @param opt 运行选项
 * @return 运行结果
 * @throw launch_error command[0] 不存在或者无法执行
 * @throw std::system_error 创建管道、fork、等待子进程失败
 */
runguard_result runit(const runguard_options &opt);

}  // namespace safeexec
