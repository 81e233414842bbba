#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "config.hpp"
#include "judge/compiler.hpp"
#include "sandbox/command_guard.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/resource_limiter.hpp"

namespace oibox {

/**
 * @brief 一次调试会话的结果
 */
struct debug_session {
    compiled_artifact artifact;

    /**
     * @brief 实际执行的调试脚本，包括前置的设置命令
     */
    std::string script;
    std::filesystem::path script_path;

    /**
     * @brief 调试器的输出（标准输出为调试记录）、返回值和结束原因
     */
    run_result transcript;
};

/**
 * @brief 以批处理模式驱动 gdb 调试单个源文件
 */
struct debugger {
    debugger(const configuration &config, const path_guard &paths, const command_guard &commands,
             const compiler &cc, const resource_limiter &limiter);

    /**
     * @brief 带调试信息编译源代码，然后在 gdb 中执行调试脚本
     * 调试会话的时间限制和输出上限是固定的，与选手程序的运行限制无关
     * @param source_text 源代码
     * @param name 经过 path_guard 清理的文件名（不含扩展名）
     * @param script 调试脚本，没有给出时使用 default_script
     * @throw command_denied 调试脚本包含不允许的命令
     * @throw compilation_error 编译失败
     * @throw internal_error 调试器不可用
     */
    debug_session debug(const std::string &source_text,
                        const std::string &name,
                        const std::optional<std::string> &script,
                        const run_options &options = {}) const;

    /**
     * @brief 默认调试脚本：在 main 处断下，打印调用栈、寄存器和接下来的指令
     */
    static const std::string &default_script();

private:
    const configuration &config;
    const path_guard &paths;
    const command_guard &commands;
    const compiler &cc;
    const resource_limiter &limiter;
};

}  // namespace oibox
