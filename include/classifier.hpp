#pragma once

#include "outcome.hpp"
#include "runguard.hpp"

namespace safeexec {

/**
 * @brief 根据沙箱的运行结果得到运行结果类别
 * 1. runguard 标记超时：TIMEOUT，不返回任何输出（用户程序在输出途中被杀死，部分输出没有意义）
 * 2. 返回值为 0：SUCCESS，输出去掉末尾的一个换行符，其余不变
 * 3. 其他情况：PROGRAM_ERROR，输出去掉首尾空白字符；错误信息为去掉首尾空白字符的 stderr，
 *    stderr 为空时为 "container exited with code <返回值>"
 * 超时的判定只依赖 runguard 的标记，用户程序返回任何值（包括 124）都不会被认为超时。
 * @param result 沙箱的运行结果
 * @param timeout_seconds 配置的时钟时间限制，用于生成超时信息
 */
outcome classify(const runguard_result &result, unsigned timeout_seconds);

}  // namespace safeexec
