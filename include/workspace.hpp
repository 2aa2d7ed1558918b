#pragma once

#include <filesystem>
#include <string>
#include "submission.hpp"

namespace safeexec {

/**
 * @brief 一次运行的工作目录
 * 工作目录只属于一次运行，离开作用域时自动删除。workspace 只能移动不能复制，
 * 因此 create 和 destroy 一一对应。
 *
 * WORKSPACE_ROOT
 * ├── safeexec-0c4f...  // 随机生成的 uuid，也是本次运行的 id
 * │   └── script.py     // 用户代码
 * └── ...
 */
struct workspace {
    workspace(std::string run_id, std::filesystem::path dir, std::string script_name);
    workspace(workspace &&other) noexcept;
    workspace(const workspace &) = delete;
    ~workspace();

    workspace &operator=(workspace &&other) noexcept;
    workspace &operator=(const workspace &) = delete;

    /**
     * @brief 本次运行的唯一标识
     */
    const std::string &run_id() const;

    /**
     * @brief 工作目录的路径
     */
    const std::filesystem::path &dir() const;

    /**
     * @brief 用户代码文件名（不含目录）
     */
    const std::string &script_name() const;

    /**
     * @brief 是否仍持有工作目录
     */
    bool valid() const;

    /**
     * @brief 立即删除工作目录，之后析构时不再重复删除
     */
    void release() noexcept;

private:
    std::string id;
    std::filesystem::path path;
    std::string script;
    bool owned;
};

/**
 * @brief 负责创建和删除每次运行的工作目录
 */
struct workspace_manager {
    /**
     * @param root 存放工作目录的根目录，必须已经存在
     * @param script_name 用户代码在工作目录中的文件名
     */
    workspace_manager(std::filesystem::path root, std::string script_name);

    /**
     * @brief 创建工作目录并写入用户代码
     * 目录名由随机 uuid 生成，与用户输入无关；若目录已存在则视为失败，不会复用其他运行的目录。
     * @throw infrastructure_error 目录无法创建或者代码无法写入（比如磁盘已满、权限不足）
     */
    workspace create(const submission &submit) const;

    /**
     * @brief 删除工作目录及其所有内容
     * 删除失败只记录日志，不抛出异常
     * @return 是否删除成功
     */
    static bool destroy(const std::filesystem::path &dir) noexcept;

private:
    std::filesystem::path root_dir;
    std::string script_name;
};

}  // namespace safeexec
