#pragma once

#include <boost/rational.hpp>
#include <string>
#include "ojudge/common/status.hpp"

namespace ojudge::judge {

/**
 * @brief 比较结果
 */
struct verdict {
    /**
     * @brief ACCEPTED、PRESENTATION_ERROR 或 WRONG_ANSWER
     */
    status result = status::WRONG_ANSWER;

    /**
     * @brief 得分比例，测试点得分为 floor(满分 * factor)
     */
    boost::rational<int> factor{0};

    /**
     * @brief 本测试点获得的分数
     */
    int score(int points) const;
};

/**
 * @brief 比较用户程序输出和标准输出
 * 1. 去除两者末尾的空白字符后完全一致：Accepted，得分比例为 1
 * 2. 把连续的空白字符压缩成一个空格并去除首尾空白后一致：Presentation Error，得分比例为 pe_ratio
 * 3. 否则为 Wrong Answer，得分比例为 0
 * 这里不关心程序是如何终止的，调用方需要先处理超时、运行时错误等情况。
 */
verdict compare(const std::string &actual, const std::string &expected, const boost::rational<int> &pe_ratio);

/**
 * @brief 去除字符串末尾的空白字符
 */
std::string strip_trailing_whitespace(const std::string &text);

/**
 * @brief 把连续的空白字符压缩为一个空格，并去除首尾的空白字符
 */
std::string normalize_whitespace(const std::string &text);

}  // namespace ojudge::judge
