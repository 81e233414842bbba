#include "gtest/gtest.h"
#include "judge/comparator.hpp"

using namespace std;
using namespace oibox;

TEST(ComparatorTest, TrailingNewlineIgnored) {
    auto verdict = compare_outputs("5\n", "5");
    EXPECT_TRUE(verdict.match);
    EXPECT_FALSE(verdict.first_difference);
    EXPECT_EQ(verdict.difference_count, 0u);
    EXPECT_EQ(verdict.actual_lines, 1u);
    EXPECT_EQ(verdict.expected_lines, 1u);
}

TEST(ComparatorTest, WhitespaceNormalized) {
    EXPECT_TRUE(compare_outputs("1  2\t3  \r\n4\n\n\n", "1 2 3\n4").match);
    EXPECT_TRUE(compare_outputs("  a b", "a b   ").match);
    EXPECT_TRUE(compare_outputs("", "\n\n").match);
    EXPECT_FALSE(compare_outputs("12", "1 2").match);
}

TEST(ComparatorTest, FirstDifferenceReported) {
    auto verdict = compare_outputs("a\nb\n", "a\nc\n");
    EXPECT_FALSE(verdict.match);
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference->line, 2u);
    EXPECT_EQ(verdict.first_difference->actual, "b");
    EXPECT_EQ(verdict.first_difference->expected, "c");
    EXPECT_EQ(verdict.first_difference_column, 1u);
    EXPECT_EQ(verdict.difference_count, 1u);
    EXPECT_NE(verdict.summary.find("line 2"), string::npos) << verdict.summary;
}

TEST(ComparatorTest, ColumnOfFirstMismatch) {
    auto verdict = compare_outputs("hello world", "hello there");
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference_column, 7u);
}

TEST(ComparatorTest, MissingLines) {
    auto verdict = compare_outputs("1\n2\n", "1\n2\n3\n4\n");
    EXPECT_FALSE(verdict.match);
    EXPECT_EQ(verdict.difference_count, 2u);
    EXPECT_EQ(verdict.first_difference->line, 3u);
    EXPECT_EQ(verdict.first_difference->actual, "");
    EXPECT_EQ(verdict.first_difference->expected, "3");
    EXPECT_EQ(verdict.actual_lines, 2u);
    EXPECT_EQ(verdict.expected_lines, 4u);
}

TEST(ComparatorTest, BlankLinesIgnored) {
    EXPECT_TRUE(compare_outputs("\n5\n", "5").match);
    EXPECT_TRUE(compare_outputs("\n\n  \n1 2\n", "1 2\n").match);
    EXPECT_TRUE(compare_outputs("a\n\nb\n", "a\nb\n").match);
    EXPECT_TRUE(compare_outputs("1\n\n2", "1\n2").match);
    EXPECT_FALSE(compare_outputs("\n5\n", "5", false).match);
}

TEST(ComparatorTest, LineBreakEqualsSpace) {
    auto verdict = compare_outputs("1 2 3", "1\n2\n3");
    EXPECT_TRUE(verdict.match);
    EXPECT_FALSE(verdict.first_difference);
    EXPECT_EQ(verdict.difference_count, 0u);
    EXPECT_TRUE(compare_outputs("1\r\n2\t3\n", "1 2\n3").match);
    EXPECT_FALSE(compare_outputs("1 2 3", "1\n2\n3", false).match);
}

TEST(ComparatorTest, DifferenceLocatedByWord) {
    // 第三个单词不同，位于程序输出的第 1 行第 5 列
    auto verdict = compare_outputs("1 2 4", "1\n2\n3");
    EXPECT_FALSE(verdict.match);
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference->line, 1u);
    EXPECT_EQ(verdict.first_difference_column, 5u);
    EXPECT_EQ(verdict.first_difference->actual, "1 2 4");
    EXPECT_EQ(verdict.first_difference->expected, "3");
    EXPECT_GE(verdict.difference_count, 1u);

    // 空行不计入行号
    verdict = compare_outputs("\n\na\nb\n", "a\nc\n");
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference->line, 2u);
    EXPECT_EQ(verdict.first_difference->actual, "b");
    EXPECT_EQ(verdict.first_difference->expected, "c");
    EXPECT_EQ(verdict.difference_count, 1u);
}

TEST(ComparatorTest, CaseSensitivity) {
    EXPECT_FALSE(compare_outputs("Hello", "hello").match);
    EXPECT_TRUE(compare_outputs("Hello", "hello", true, true).match);
    EXPECT_FALSE(compare_outputs("YES\n", "yes", false, true).match);
    EXPECT_TRUE(compare_outputs("YES\n", "yes\n", false, true).match);
}

TEST(ComparatorTest, ExactComparison) {
    EXPECT_TRUE(compare_outputs("1 2\n", "1 2\n", false).match);

    auto verdict = compare_outputs("5\n", "5", false);
    EXPECT_FALSE(verdict.match);
    // 逐行比较没有区别，只有末尾的换行符不同
    EXPECT_FALSE(verdict.first_difference);
    EXPECT_FALSE(verdict.summary.empty());

    verdict = compare_outputs("1  2\n", "1 2\n", false);
    EXPECT_FALSE(verdict.match);
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference_column, 3u);
}

TEST(ComparatorTest, DifferencesAreBounded) {
    string actual, expected;
    for (int i = 0; i < 20; ++i) {
        actual += to_string(i) + "\n";
        expected += to_string(i + 100) + "\n";
    }
    auto verdict = compare_outputs(actual, expected);
    EXPECT_EQ(verdict.difference_count, 20u);
    EXPECT_EQ(verdict.differences.size(), MAX_DIFFERENCES);
    EXPECT_EQ(verdict.differences[0].line, 1u);
    EXPECT_EQ(verdict.differences[4].line, 5u);
}

TEST(ComparatorTest, ExcerptsAreBounded) {
    string prefix(1000, 'a');
    auto verdict = compare_outputs(prefix + "x" + string(1000, 'b'), prefix + "y" + string(1000, 'b'));
    ASSERT_TRUE(verdict.first_difference);
    EXPECT_EQ(verdict.first_difference_column, 1001u);
    EXPECT_LE(verdict.first_difference->actual.size(), MAX_EXCERPT_LENGTH + 3);
    EXPECT_LE(verdict.first_difference->expected.size(), MAX_EXCERPT_LENGTH + 3);
    // 片段包含不同的位置
    EXPECT_NE(verdict.first_difference->actual.find('x'), string::npos);
    EXPECT_NE(verdict.first_difference->expected.find('y'), string::npos);
    EXPECT_LE(verdict.differences[0].actual.size(), MAX_EXCERPT_LENGTH + 3);
    EXPECT_LT(verdict.summary.size(), 256u);
}
