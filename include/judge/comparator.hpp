#pragma once

#include <optional>
#include <string>
#include <vector>

namespace oibox {

/**
 * @brief 差异摘要中每个片段的最大长度
 */
const size_t MAX_EXCERPT_LENGTH = 64;

/**
 * @brief 最多列出的不同行数
 */
const size_t MAX_DIFFERENCES = 5;

/**
 * @brief 不同的一行，行号从 1 开始，内容已经截断到 MAX_EXCERPT_LENGTH
 * 某一边没有这一行时对应的内容为空串
 */
struct line_difference {
    size_t line;
    std::string actual;
    std::string expected;
};

/**
 * @brief 比较结果
 */
struct comparison_verdict {
    bool match = true;

    /**
     * @brief 第一处不同所在的行和列（从 1 开始），match 为真时没有值
     * 片段从第一个不同的字符附近开始截取
     */
    std::optional<line_difference> first_difference;
    size_t first_difference_column = 0;

    /**
     * @brief 前 MAX_DIFFERENCES 个不同的行
     */
    std::vector<line_difference> differences;

    /**
     * @brief 不同的行的总数
     */
    size_t difference_count = 0;

    /**
     * @brief 规范化后的行数
     */
    size_t actual_lines = 0;
    size_t expected_lines = 0;

    /**
     * @brief 简短的文字摘要
     */
    std::string summary;
};

/**
 * @brief 比较程序输出与期望输出
 * 两边使用同样的规范化规则：
 * ignore_whitespace 时只比较以任意空白分隔的单词序列，换行与空格等价，空行被忽略，
 * 报告中的行号是去掉空行、每行连续空白合并为一个空格之后的行号；
 * ignore_case 时按 ASCII 忽略大小写。
 * @param actual 程序输出
 * @param expected 期望输出
 */
comparison_verdict compare_outputs(const std::string &actual,
                                   const std::string &expected,
                                   bool ignore_whitespace = true,
                                   bool ignore_case = false);

}  // namespace oibox
