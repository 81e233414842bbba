#pragma once

#include <stdlib.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include "config.hpp"

namespace oibox::test {

inline const char *COMPILER_PATH = "/usr/bin/g++";
inline const char *DEBUGGER_PATH = "/usr/bin/gdb";

inline bool has_compiler() {
    return access(COMPILER_PATH, X_OK) == 0;
}

inline bool has_debugger() {
    return access(DEBUGGER_PATH, X_OK) == 0;
}

/**
 * @brief 在临时目录下创建一个新目录，返回规范化后的路径
 */
inline std::filesystem::path make_temp_dir(const std::string &prefix) {
    std::string pattern = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
    if (!mkdtemp(pattern.data()))
        throw std::system_error(errno, std::generic_category(), "mkdtemp");
    return std::filesystem::canonical(pattern);
}

/**
 * @brief 测试使用的配置，沙箱位于 root 下，编译器和调试器使用系统自带的
 */
inline configuration make_config(const std::filesystem::path &root) {
    configuration config;
    config.sandbox_root = root / "sandbox";
    config.compiler.path = COMPILER_PATH;
    config.compiler.standard = "c++17";
    config.compiler.optimization = "-O2";
    config.compiler.time_limit_ms = 60000;
    config.debugger.path = DEBUGGER_PATH;
    config.debugger.time_limit_ms = 60000;
    config.execution.default_time_limit_ms = 2000;
    config.execution.max_time_limit_ms = 10000;
    config.execution.default_memory_limit_mb = 256;
    config.execution.max_memory_limit_mb = 1024;
    config.execution.max_output_size = 65536;
    config.workers = 2;
    return config;
}

/**
 * @brief 计时器，使用单调时钟
 */
struct elapsed_time {
    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

/**
 * @brief 每个测试使用独立的临时目录，析构时删除
 */
struct temp_directory {
    std::filesystem::path path;

    explicit temp_directory(const std::string &prefix = "oibox-test")
        : path(make_temp_dir(prefix)) {}

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    temp_directory(const temp_directory &) = delete;
    temp_directory &operator=(const temp_directory &) = delete;
};

}  // namespace oibox::test
