#pragma once

#include <boost/rational.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace ojudge {

/**
 * @brief 评测引擎的配置
 * 在引擎构造时传入，之后只读，因此多个评测线程可以共享同一个配置。
 * 可以通过 JSON 配置文件加载，也可以由命令行参数覆盖（参见 main.cpp）。
 *
 * JSON 格式（所有字段都是可选的）：
 * @code{.json}
 * {
 *     "scratchDir": "/tmp/ojudge",
 *     "compileTimeLimit": 30000,
 *     "sampleInterval": 10,
 *     "outputLimit": 67108864,
 *     "maxCompileOutput": 65536,
 *     "maxReportSize": 4096,
 *     "maxSourceLength": 100000,
 *     "presentationRatio": "4/5"
 * }
 * @endcode
 */
struct engine_config {
    /**
     * @brief 存放所有评测任务工作目录的根目录
     * 评测引擎假设自己独占该目录的写权限。
     *
     * SCRATCH_DIR
     * ├── 1001-3f2a... // 任务 id 加随机 uuid
     * │   ├── main.cpp // 选手代码
     * │   └── main // 编译产物
     * └── ...
     */
    std::filesystem::path scratch_dir = std::filesystem::temp_directory_path() / "ojudge";

    /**
     * @brief 编译时间限制，与题目的时间限制无关
     */
    std::chrono::milliseconds compile_time_limit{30000};

    /**
     * @brief 内存采样的时间间隔
     * 每个间隔内会读取一次用户程序进程树的常驻内存，
     * 同时也是取消请求生效的最长延迟。
     */
    std::chrono::milliseconds sample_interval{10};

    /**
     * @brief 用户程序标准输出的上限（字节），超出时返回 Output Limit Exceeded
     */
    std::size_t output_limit = 64 << 20;

    /**
     * @brief 保存的编译器输出的上限（字节）
     */
    std::size_t max_compile_output = 64 << 10;

    /**
     * @brief 评测结果中保存的用户程序输出的上限（字节），仅用于诊断
     */
    std::size_t max_report_size = 4096;

    /**
     * @brief 源代码长度上限（字节）
     */
    std::size_t max_source_length = 100000;

    /**
     * @brief 格式错误时获得的分数比例，评测任务可以自行覆盖
     */
    boost::rational<int> presentation_ratio{4, 5};
};

/**
 * @throw nlohmann::json::exception 字段类型不正确
 * @throw std::invalid_argument 字段值不合法（比如比例不在 [0, 1] 内）
 */
void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 解析形如 "4/5" 或者 "0.8" 的分数比例
 * @throw std::invalid_argument 比例格式不正确或者不在 [0, 1] 内
 */
boost::rational<int> parse_ratio(const std::string &text);

}  // namespace ojudge
