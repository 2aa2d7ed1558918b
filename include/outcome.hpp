#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace safeexec {

/**
 * @brief 一次运行的结果
 * 只能通过静态工厂函数构造，保证结果类别和字段一致：
 * SUCCESS 只有 output；PROGRAM_ERROR 有 output 和 error；
 * TIMEOUT 只有 timeout_seconds；VALIDATION_ERROR、INFRASTRUCTURE_ERROR 只有 error。
 */
struct outcome {
    status get_status() const;

    /**
     * @brief 用户程序的标准输出
     */
    const std::string &output() const;

    /**
     * @brief 错误信息，对于 TIMEOUT 为生成的超时描述
     */
    std::string error() const;

    /**
     * @brief 超时的时间限制，只对 TIMEOUT 有意义
     */
    unsigned timeout_seconds() const;

    static outcome success(std::string output);
    static outcome program_error(std::string output, std::string error);
    static outcome timeout(unsigned seconds);
    static outcome validation_error(std::string reason);
    static outcome infrastructure_error(std::string reason);

private:
    outcome(status s, std::string output, std::string error, unsigned seconds);

    status s;
    std::string out;
    std::string err;
    unsigned seconds;
};

/**
 * @brief 将运行结果转换为返回给调用方的数据
 * SUCCESS: {output}；PROGRAM_ERROR: {output, error}；其余: {error}
 */
void to_json(nlohmann::json &j, const outcome &result);

}  // namespace safeexec
