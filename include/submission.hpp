#pragma once

#include <string>

namespace safeexec {

/**
 * @brief 表示一份提交的代码
 * 只能通过 make_submission 构造，因此持有 submission 就意味着代码已经通过了检查
 */
struct submission {
    /**
     * @brief 用户代码
     */
    const std::string code;

    /**
     * @brief 允许的最大代码长度（字符数）
     */
    const size_t max_length;

private:
    submission(std::string code, size_t max_length);

    friend submission make_submission(std::string code, size_t max_length);
};

/**
 * @brief 检查并构造提交
 * 代码必须是合法的 UTF-8 文本，不能包含 NUL 字符，长度（按字符计算）不能超过 max_length
 * @throw validation_error 代码不合法
 */
submission make_submission(std::string code, size_t max_length);

}  // namespace safeexec
