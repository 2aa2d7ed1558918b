#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace safeexec {

struct safeexec_exception : std::exception {
    safeexec_exception();
    explicit safeexec_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const safeexec_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的代码不合法
 * 比如代码过长、不是合法的文本。这类错误在分配任何资源之前就会被拒绝，
 * 调用方修正输入之后可以重试。
 */
struct validation_error : public safeexec_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示宿主机的错误
 * 比如无法创建工作目录、无法启动沙箱。这类错误与用户代码无关，
 * 需要和用户程序的错误区分开来，避免误报为用户的代码有问题。
 */
struct infrastructure_error : public safeexec_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示外部程序无法启动，一般是宿主机没有安装该程序
 */
struct launch_error : public infrastructure_error {
    const std::string binary;

    launch_error(const std::string &binary, int err);
};

}  // namespace safeexec
