#pragma once

#include <filesystem>
#include <string>
#include "ojudge/language.hpp"

namespace ojudge {

/**
 * @brief 一个评测任务独占的工作目录
 * 选手代码、编译产物都存放在这里，编译器和用户程序都以这里为工作路径运行。
 * 目录名由任务 id 和随机 uuid 组成，因此并发评测的任务不会共享工作目录，
 * 这也是评测任务之间唯一需要的同步手段。
 *
 * 对象只能移动。destroy() 只会真正执行一次，如果对象析构时还没有被 destroy，
 * 析构函数会负责删除目录。
 */
struct workspace {
    /**
     * @brief 在 root 下为任务分配一个新的工作目录
     * @param root 所有工作目录的根目录，不存在时会被创建
     * @param task_id 任务 id，必须是一个普通的文件名
     * @throw workspace_allocation_error 任务 id 不合法、目录已存在或者无法创建
     */
    static workspace create(const std::filesystem::path &root, const std::string &task_id);

    workspace(workspace &&other) noexcept;
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    const std::filesystem::path &path() const;

    /**
     * @brief 将代码原样写入源代码文件，文件名由语言配置决定
     * 这里不检查代码内容
     * @return 源代码文件的路径
     */
    std::filesystem::path write_source(const language_profile &profile, const std::string &code) const;

    /**
     * @brief 递归删除工作目录
     * 重复调用不会有任何效果，删除失败时只记录日志，不会抛出异常，
     * 因为此时评测结果已经得到了。
     * @return 本次调用是否真正删除了目录
     */
    bool destroy() noexcept;

    bool destroyed() const;

private:
    explicit workspace(std::filesystem::path dir);

    std::filesystem::path dir;
    bool released = false;
};

}  // namespace ojudge
