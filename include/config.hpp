#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace safeexec {

/**
 * @brief 执行服务的全局配置
 * 在进程启动时构造一次，之后以常量的形式显式传给 executor，运行期间不允许修改。
 */
struct configuration {
    /**
     * @brief 提交代码的最大长度（字符数）
     */
    size_t max_code_length = 5000;

    /**
     * @brief 宿主机时钟时间限制，单位为秒，必须大于 0
     */
    unsigned timeout_seconds = 10;

    /**
     * @brief 沙箱的内存限制，格式为 <数字>[b|k|m|g]，比如 128m
     */
    std::string memory_limit = "128m";

    /**
     * @brief 沙箱镜像，镜像内需要包含解释器，且以非 root 用户运行
     */
    std::string sandbox_image = "safe-python-runner:latest";

    /**
     * @brief 沙箱内同时存在的最大进程（线程）数
     */
    size_t process_limit = 64;

    /**
     * @brief 容器运行时的可执行文件，按照 PATH 查找
     */
    std::string runtime = "docker";

    /**
     * @brief 存放每次运行工作目录的根目录
     * 为空时使用系统临时目录
     */
    std::filesystem::path workspace_root;

    /**
     * @brief 用户代码在工作目录中的文件名
     */
    std::string script_name = "script.py";

    /**
     * @brief 工作目录在沙箱内的挂载点（只读挂载）
     */
    std::string mount_point = "/app";

    /**
     * @brief 沙箱内运行用户代码的解释器命令，用户代码路径会追加在最后
     */
    std::vector<std::string> interpreter = {"python"};

    /**
     * @brief 沙箱内运行用户程序的用户，为空时使用镜像的默认用户
     */
    std::string run_user;

    /**
     * @brief 每个输出流最多保存的字节数，超出部分将被丢弃
     * 小于 0 时使用内存限制的大小
     */
    int64_t output_limit = -1;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 从 JSON 配置文件读取配置，文件中没有出现的配置项保持 config 中原有的值
 * @throw std::runtime_error 文件不存在
 * @throw nlohmann::json::exception 文件格式不正确
 * @throw std::invalid_argument 计数类的配置项不是非负整数
 */
void load_configuration(const std::filesystem::path &path, configuration &config);

/**
 * @brief 解析命令行或环境变量中的非负整数
 * @param name 配置项名称，用于错误信息
 * @param max 允许的最大值
 * @throw std::invalid_argument 不是非负整数（包括负数和空串）或者大于 max
 */
uint64_t parse_count(const std::string &name, const std::string &literal, uint64_t max);

/**
 * @brief 解析内存限制字符串
 * @param literal 比如 "128m"、"1g"、"65536k"、"1048576"
 * @return 内存限制的字节数
 * @throw std::invalid_argument 格式不正确或者数值溢出
 */
int64_t parse_memory_limit(const std::string &literal);

/**
 * @brief 检查配置是否合法，并补全默认值（workspace_root、output_limit）
 * @throw std::invalid_argument 配置不合法
 */
void validate_configuration(configuration &config);

}  // namespace safeexec
