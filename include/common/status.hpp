#pragma once

namespace safeexec {

/**
 * @brief 表示一次运行的结果类别
 * 每次运行有且仅有一个结果类别
 */
enum class status {
    /**
     * @brief 用户程序正常结束（返回值为 0）
     */
    SUCCESS = 0,

    /**
     * @brief 用户程序运行结束，但返回值非 0
     * 一般是抛出了未捕获的异常，或者被信号终止。
     */
    PROGRAM_ERROR = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 由宿主机的时钟时间限制判定，不依赖沙箱自身的超时机制。
     */
    TIMEOUT = 2,

    /**
     * @brief 提交的代码不合法，没有分配任何资源就被拒绝
     */
    VALIDATION_ERROR = 3,

    /**
     * @brief 内部错误，宿主机出错
     * 比如沙箱程序不存在、工作目录无法创建。
     */
    INFRASTRUCTURE_ERROR = 4
};

const char *get_display_message(status);

/**
 * @brief 结果类别对应的 HTTP 状态码
 * 用户导致的错误为 4xx，宿主机导致的错误为 5xx
 */
int get_status_class(status);

}  // namespace safeexec
