#include "judge/comparator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>

namespace oibox {
using namespace std;

static const char *WHITESPACE = " \t\r\f\v";

/**
 * @brief 将输出按行拆分并规范化
 * 忽略空白时每行只保留以单个空格分隔的单词，空行全部去掉
 */
static vector<string> normalize(const string &text, bool ignore_whitespace, bool ignore_case) {
    string s = text;
    if (ignore_case) boost::algorithm::to_lower(s, locale::classic());

    vector<string> lines;
    if (ignore_whitespace) {
        vector<string> raw_lines;
        boost::split(raw_lines, s, boost::is_any_of("\n"));
        for (auto &line : raw_lines) {
            vector<string> words;
            boost::split(words, line, boost::is_any_of(WHITESPACE), boost::token_compress_on);
            words.erase(remove(words.begin(), words.end(), ""), words.end());
            if (!words.empty()) lines.push_back(boost::algorithm::join(words, " "));
        }
    } else {
        boost::split(lines, s, boost::is_any_of("\n"));
        // 最后一个换行符之后的空串不算一行
        if (!lines.empty() && lines.back().empty()) lines.pop_back();
    }
    return lines;
}

/**
 * @brief 规范化后的一个单词及其所在的行和列（从 0 开始）
 */
struct word_position {
    string word;
    size_t line;
    size_t column;
};

static vector<word_position> split_words(const vector<string> &lines) {
    vector<word_position> words;
    for (size_t i = 0; i < lines.size(); ++i) {
        size_t begin = 0;
        while (begin < lines[i].size()) {
            size_t end = lines[i].find(' ', begin);
            if (end == string::npos) end = lines[i].size();
            words.push_back({lines[i].substr(begin, end - begin), i, begin});
            begin = end + 1;
        }
    }
    return words;
}

/**
 * @brief 从 begin 开始截取不超过 MAX_EXCERPT_LENGTH 的片段
 */
static string excerpt(const string &line, size_t begin = 0) {
    if (begin >= line.size()) return "";
    string result = line.substr(begin, MAX_EXCERPT_LENGTH);
    if (begin + MAX_EXCERPT_LENGTH < line.size()) result += "...";
    return result;
}

static size_t common_prefix(const string &a, const string &b) {
    return mismatch(a.begin(), a.begin() + min(a.size(), b.size()), b.begin()).first - a.begin();
}

/**
 * @brief 从第一个不同的字符之前一点开始截取两边的片段
 */
static line_difference make_first_difference(size_t line, const string &a, size_t actual_column,
                                             const string &e, size_t expected_column) {
    auto begin = [](size_t column) { return column > 16 ? column - 16 : 0; };
    return line_difference{line + 1, excerpt(a, begin(actual_column)), excerpt(e, begin(expected_column))};
}

comparison_verdict compare_outputs(const string &actual, const string &expected, bool ignore_whitespace, bool ignore_case) {
    comparison_verdict verdict;

    vector<string> actual_lines = normalize(actual, ignore_whitespace, ignore_case);
    vector<string> expected_lines = normalize(expected, ignore_whitespace, ignore_case);
    verdict.actual_lines = actual_lines.size();
    verdict.expected_lines = expected_lines.size();
    const string empty;

    if (ignore_whitespace) {
        // 忽略空白时只比较单词序列，换行和空格等价
        vector<word_position> actual_words = split_words(actual_lines);
        vector<word_position> expected_words = split_words(expected_lines);
        size_t k = 0;
        while (k < actual_words.size() && k < expected_words.size() &&
               actual_words[k].word == expected_words[k].word)
            ++k;
        verdict.match = k == actual_words.size() && k == expected_words.size();
        if (verdict.match) {
            verdict.summary = fmt::format("Outputs match ({} lines)", verdict.expected_lines);
            return verdict;
        }

        bool has_actual = k < actual_words.size(), has_expected = k < expected_words.size();
        size_t actual_line = has_actual ? actual_words[k].line : actual_lines.size();
        size_t expected_line = has_expected ? expected_words[k].line : expected_lines.size();
        const string &a = has_actual ? actual_lines[actual_line] : empty;
        const string &e = has_expected ? expected_lines[expected_line] : empty;
        size_t prefix = has_actual && has_expected ? common_prefix(actual_words[k].word, expected_words[k].word) : 0;
        size_t actual_column = has_actual ? actual_words[k].column + prefix : 0;
        size_t expected_column = has_expected ? expected_words[k].column + prefix : 0;
        // 行号和列号以程序输出为准，程序输出提前结束时以期望输出为准
        verdict.first_difference = make_first_difference(has_actual ? actual_line : expected_line,
                                                         a, actual_column, e, expected_column);
        verdict.first_difference_column = (has_actual ? actual_column : expected_column) + 1;
    } else {
        // 不忽略空白时逐字节比较，包括末尾的换行符
        string a = actual, e = expected;
        if (ignore_case) {
            boost::algorithm::to_lower(a, locale::classic());
            boost::algorithm::to_lower(e, locale::classic());
        }
        verdict.match = a == e;
    }

    size_t max_lines = max(actual_lines.size(), expected_lines.size());
    for (size_t i = 0; i < max_lines; ++i) {
        const string &a = i < actual_lines.size() ? actual_lines[i] : empty;
        const string &e = i < expected_lines.size() ? expected_lines[i] : empty;
        bool missing = i >= actual_lines.size() || i >= expected_lines.size();
        if (a == e && !missing) continue;

        ++verdict.difference_count;
        if (!verdict.first_difference) {
            size_t column = common_prefix(a, e);
            verdict.first_difference = make_first_difference(i, a, column, e, column);
            verdict.first_difference_column = column + 1;
        }
        if (verdict.differences.size() < MAX_DIFFERENCES)
            verdict.differences.push_back({i + 1, excerpt(a), excerpt(e)});
    }

    if (verdict.match) {
        verdict.summary = fmt::format("Outputs match ({} lines)", verdict.expected_lines);
    } else if (verdict.first_difference) {
        verdict.summary = fmt::format("Outputs differ in {} line(s), first at line {} column {}; {} actual line(s), {} expected line(s)",
                                      verdict.difference_count, verdict.first_difference->line, verdict.first_difference_column,
                                      verdict.actual_lines, verdict.expected_lines);
    } else {
        // 逐行相同但逐字节不同，比如只有末尾的换行符不同
        verdict.summary = "Outputs differ only in trailing whitespace or line endings";
    }
    return verdict;
}

}  // namespace oibox
