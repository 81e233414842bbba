#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "sandbox/command_guard.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/resource_limiter.hpp"

namespace oibox {

/**
 * @brief 编译产物
 * 只有编译器返回 0 且生成了可执行文件时才存在
 */
struct compiled_artifact {
    /**
     * @brief 本次调用的文件名（不含扩展名），同一个名字用于源代码、可执行文件、输入输出文件
     */
    std::string name;

    std::filesystem::path source;
    std::filesystem::path executable;

    /**
     * @brief 编译器的标准错误，原样保留
     */
    std::string diagnostics;

    int exit_code = 0;
    int64_t time_ms = 0;
};

/**
 * @brief 检查语言标准，比如 c++17、gnu++20
 */
bool is_valid_standard(const std::string &standard);

/**
 * @brief 检查优化选项，只允许 -O0 -O1 -O2 -O3 -Os -Og -Ofast
 */
bool is_valid_optimization(const std::string &optimization);

/**
 * @brief 调用配置的编译器编译单个 C++ 源文件
 */
struct compiler {
    compiler(const configuration &config, const path_guard &paths, const command_guard &commands, const resource_limiter &limiter);

    /**
     * @brief 将源代码写入 sources 子目录并编译到 execute 子目录
     * 编译时间和内存使用配置中的固定限制，与选手程序的运行限制无关
     * @param source_text 源代码
     * @param name 经过 path_guard 清理的文件名（不含扩展名）
     * @param standard 语言标准
     * @param optimization 优化选项
     * @param options 取消标记
     * @throw validation_error 语言标准或者优化选项不合法
     * @throw compilation_error 编译失败、超时、编译器崩溃或者没有生成可执行文件
     */
    compiled_artifact compile(const std::string &source_text,
                              const std::string &name,
                              const std::string &standard,
                              const std::string &optimization,
                              const run_options &options = {}) const;

    /**
     * @brief 带调试信息编译（-g -O0），给调试器使用
     */
    compiled_artifact compile_debug(const std::string &source_text,
                                    const std::string &name,
                                    const std::string &standard,
                                    const run_options &options = {}) const;

private:
    const configuration &config;
    const path_guard &paths;
    const command_guard &commands;
    const resource_limiter &limiter;

    compiled_artifact invoke(const std::string &source_text,
                             const std::string &name,
                             const std::string &standard,
                             const std::vector<std::string> &mode_flags,
                             const run_options &options) const;
};

}  // namespace oibox
