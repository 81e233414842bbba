#pragma once

#include <string>
#include <vector>
#include "sandbox/path_guard.hpp"

namespace oibox {

/**
 * @brief 一组测试数据
 */
struct test_case {
    std::string id;
    std::string input;
    std::string expected_output;
};

/**
 * @brief 只读的测试数据仓库，数据保存在沙箱的 tests 目录下
 * <id>.in 为标准输入，<id>.out 为期望输出，没有 .out 时使用 <id>.ans
 */
struct test_case_store {
    explicit test_case_store(const path_guard &paths);

    /**
     * @brief 读取一组测试数据
     * @param id 测试数据编号，必须和 sanitize 之后的结果相同
     * @throw path_violation 编号不合法
     * @throw not_found 输入文件或者输出文件不存在
     */
    test_case lookup(const std::string &id) const;

    /**
     * @brief 列出所有同时有输入和输出的测试数据编号，按字典序排列
     */
    std::vector<std::string> list() const;

private:
    const path_guard &paths;
};

}  // namespace oibox
