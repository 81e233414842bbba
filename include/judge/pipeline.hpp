#pragma once

#include <optional>
#include <string>
#include "config.hpp"
#include "judge/comparator.hpp"
#include "judge/compiler.hpp"
#include "judge/debugger.hpp"
#include "judge/executor.hpp"
#include "sandbox/command_guard.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/resource_limiter.hpp"

namespace oibox {

/**
 * @brief 一次编译运行请求
 */
struct run_request {
    std::string code;
    std::string input;
    std::optional<std::string> expected_output;

    /**
     * @brief 建议的文件名，只作为生成文件名的前缀
     */
    std::optional<std::string> filename;

    std::optional<int64_t> time_limit_ms;
    std::optional<int64_t> memory_limit_mb;

    /**
     * @brief 语言标准和优化选项，没有给出时使用配置中的默认值
     */
    std::optional<std::string> standard;
    std::optional<std::string> optimization;

    bool ignore_whitespace = true;
    bool ignore_case = false;
};

/**
 * @brief 一次编译运行的结果
 */
struct run_report {
    compiled_artifact artifact;
    run_limits limits;
    run_result execution;

    /**
     * @brief 给出了期望输出时的比较结果
     */
    std::optional<comparison_verdict> comparison;

    /**
     * @brief 正常退出、返回值为 0，并且比较通过（如果有比较的话）
     */
    bool success() const;
};

/**
 * @brief 编译、运行、比较的完整流程
 * 持有所有组件，组件之间只通过引用共享只读的配置。可以被多个线程同时调用。
 */
struct pipeline {
    /**
     * @param config 配置，必须比 pipeline 活得更久
     * @param limiter 资源限制器，为空时使用默认实现
     */
    explicit pipeline(const configuration &config, std::shared_ptr<const resource_limiter> limiter = nullptr);

    /**
     * @brief 创建沙箱目录，启动时调用一次
     */
    void prepare() const;

    /**
     * @brief 编译并运行源代码，给出期望输出时比较输出
     * 请求的限制在编译前检查。除非配置了 keep_files，本次调用产生的文件在返回前删除。
     * @throw validation_error 限制、语言标准或者优化选项不合法
     * @throw path_violation 文件名不合法
     * @throw compilation_error 编译失败
     * @throw invocation_cancelled 请求被取消
     */
    run_report compile_and_run(const run_request &request, const run_options &options = {}) const;

    /**
     * @brief 编译并在调试器中运行源代码
     * @param code 源代码
     * @param script 调试脚本，为空时使用默认脚本
     */
    debug_session debug(const std::string &code, const std::optional<std::string> &script,
                        const run_options &options = {}) const;

    const configuration &config() const;
    const path_guard &paths() const;

private:
    const configuration &conf;
    std::shared_ptr<const resource_limiter> limiter;
    path_guard guard;
    command_guard commands;
    compiler cc;
    executor exec;
    debugger gdb;

    void cleanup(const std::string &name) const;
};

}  // namespace oibox
