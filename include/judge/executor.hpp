#pragma once

#include <optional>
#include <string>
#include "config.hpp"
#include "judge/compiler.hpp"
#include "sandbox/command_guard.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/resource_limiter.hpp"

namespace oibox {

/**
 * @brief 根据请求和配置计算运行限制
 * 没有给出的限制使用默认值，超过最大值的限制被截断到最大值
 * @param config 运行限制配置
 * @param time_limit_ms 请求的时间限制，单位为毫秒
 * @param memory_limit_mb 请求的内存限制，单位为 MB
 * @throw validation_error 请求的限制不是正数
 */
run_limits resolve_limits(const execution_config &config,
                          std::optional<int64_t> time_limit_ms,
                          std::optional<int64_t> memory_limit_mb);

/**
 * @brief 在资源限制下运行编译产物
 */
struct executor {
    executor(const configuration &config, const path_guard &paths, const command_guard &commands, const resource_limiter &limiter);

    /**
     * @brief 运行编译产物，input 作为完整的标准输入，非交互
     * 工作目录为 execute 子目录下本次调用独立的 <name>.work 目录，没有配置 keep_files 时运行结束后删除。配置了 keep_files 时将输入和标准输出保存在 inputs 和 outputs 子目录。
     * @throw command_denied 可执行文件不是 execute 子目录中的编译产物
     * @throw invocation_cancelled 请求被取消
     */
    run_result execute(const compiled_artifact &artifact,
                       const std::string &input,
                       const run_limits &limits,
                       const run_options &options = {}) const;

private:
    const configuration &config;
    const path_guard &paths;
    const command_guard &commands;
    const resource_limiter &limiter;
};

}  // namespace oibox
