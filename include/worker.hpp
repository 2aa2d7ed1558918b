#pragma once

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include "executor.hpp"
#include "outcome.hpp"

/**
 * 批量运行服务相关函数
 * 请求和响应都是每行一个 JSON 对象：
 *     请求：{"id": <任意值>, "code": "<用户代码>"}
 *     响应：{"id": <请求的 id>, "status": 200, "output": "..."}
 * 主线程负责读取请求并放入队列，worker 线程从队列中取出请求运行，
 * 运行完成的请求立即输出，因此响应的顺序和请求的顺序不一定相同。
 */
namespace safeexec {

/**
 * @brief 生成返回给调用方的数据，包含 HTTP 状态码
 */
nlohmann::json make_response(const outcome &result);

/**
 * @brief 处理一行请求
 * 请求不是 JSON 对象时返回 400 malformed request；code 不是字符串时返回 400 code must be a string。
 * @param exec 执行请求的 executor
 * @param line 一行请求
 * @return 响应，如果请求中有 id 则原样带上
 */
nlohmann::json handle_request(const executor &exec, const std::string &line);

/**
 * @brief 将响应序列化为一行文本，用户程序输出中的非法 UTF-8 字节会被替换
 */
std::string dump_response(const nlohmann::json &response);

/**
 * @brief 启动 worker 线程处理请求，直到输入结束且所有请求都处理完成
 * @param exec 执行请求的 executor
 * @param in 请求输入流
 * @param out 响应输出流
 * @param workers worker 线程数量
 * @return 处理的请求数量
 */
size_t serve(const executor &exec, std::istream &in, std::ostream &out, size_t workers);

}  // namespace safeexec
