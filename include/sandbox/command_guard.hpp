#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/path_guard.hpp"

namespace oibox {

/**
 * @brief 检查将要执行的命令
 * 进程总是通过参数数组直接 execve，不经过 shell，这里的检查是额外的一层防护：
 * 可执行文件只能是配置的编译器、调试器，或者 execute 子目录中的编译产物。
 */
struct command_guard {
    command_guard(const configuration &config, const path_guard &paths);

    /**
     * @brief 检查可执行文件和参数
     * @param executable 可执行文件路径
     * @param args 参数（不含 argv[0]）
     * @return 拒绝的原因，允许执行时返回 std::nullopt
     */
    std::optional<std::string> check(const std::filesystem::path &executable, const std::vector<std::string> &args) const;

    /**
     * @brief 同 check，但是拒绝时抛出 command_denied
     */
    void enforce(const std::filesystem::path &executable, const std::vector<std::string> &args) const;

    /**
     * @brief 检查 gdb 批处理脚本
     * 只允许查看和控制被调试程序的命令，拒绝 shell、python、文件读写、日志重定向等命令
     * @return 拒绝的原因，允许执行时返回 std::nullopt
     */
    std::optional<std::string> check_debug_script(const std::string &script) const;

private:
    const configuration &config;
    const path_guard &paths;
};

}  // namespace oibox
