#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "ojudge/common/cancellation.hpp"
#include "ojudge/config.hpp"
#include "ojudge/language.hpp"
#include "ojudge/workspace.hpp"

namespace ojudge {

/**
 * @brief 编译的结果
 */
struct compile_outcome {
    enum class kind {
        /**
         * @brief 编译器返回 0 并且生成了编译产物，或者语言不需要编译
         */
        SUCCESS,

        /**
         * @brief 编译失败，是选手代码的问题，对应 Compile Error
         */
        FAILURE,

        /**
         * @brief 无法启动编译器或者编译被取消，不应归咎于选手代码，对应 System Error
         */
        SYSTEM_ERROR
    };

    kind result = kind::SYSTEM_ERROR;

    /**
     * @brief 编译产物的路径，只在编译成功时有意义
     * 解释型语言的编译产物就是源代码文件
     */
    std::filesystem::path artifact;

    /**
     * @brief 编译器的标准输出和标准错误（已截断），或者系统错误的原因
     */
    std::string diagnostics;

    std::chrono::milliseconds time{0};

    bool cancelled = false;

    bool succeeded() const;
};

/**
 * @brief 在工作目录中编译选手代码
 * 编译器的标准错误合并到标准输出，时间受 compile_time_limit 限制，
 * 输出最多保存 max_compile_output 字节。
 * 不会抛出异常，所有错误都反映在返回值中。
 * @param ws 评测任务的工作目录，编译器在此目录下运行
 * @param profile 语言配置
 * @param source 已经写入工作目录的源代码文件
 */
compile_outcome compile(const workspace &ws, const language_profile &profile, const std::filesystem::path &source,
                        const engine_config &config, const cancellation_token *cancel = nullptr);

}  // namespace ojudge
