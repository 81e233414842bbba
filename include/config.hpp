#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace oibox {

/**
 * @brief 描述编译器调用的配置
 */
struct compiler_config {
    /**
     * @brief 编译器可执行文件的绝对路径，比如 /usr/bin/g++
     */
    std::filesystem::path path;

    /**
     * @brief 默认的语言标准，比如 c++17
     */
    std::string standard = "c++17";

    /**
     * @brief 默认的优化选项，比如 -O2
     */
    std::string optimization = "-O2";

    /**
     * @brief 追加在命令行末尾的编译选项
     */
    std::vector<std::string> flags = {"-Wall"};

    /**
     * @brief 编译时间限制，单位为毫秒
     */
    int64_t time_limit_ms = 30000;

    /**
     * @brief 编译器的内存限制（地址空间），单位为 MB，0 表示不限制
     */
    int64_t memory_limit_mb = 2048;

    /**
     * @brief 编译器诊断信息的最大长度，单位为字节
     */
    size_t max_diagnostics_size = 1 << 20;
};

/**
 * @brief 描述调试器调用的配置
 */
struct debugger_config {
    /**
     * @brief gdb 可执行文件的绝对路径
     */
    std::filesystem::path path = "/usr/bin/gdb";

    /**
     * @brief 一次调试会话的时间限制，单位为毫秒
     */
    int64_t time_limit_ms = 30000;

    /**
     * @brief 调试器的内存限制（地址空间），单位为 MB，0 表示不限制
     */
    int64_t memory_limit_mb = 0;
};

/**
 * @brief 选手程序的运行限制
 * 请求中没有给出的限制使用默认值，超过最大值的限制会被截断到最大值
 */
struct execution_config {
    int64_t default_time_limit_ms = 5000;
    int64_t max_time_limit_ms = 30000;
    int64_t default_memory_limit_mb = 256;
    int64_t max_memory_limit_mb = 2048;

    /**
     * @brief 标准输出和标准错误合计的最大长度，单位为字节
     */
    size_t max_output_size = 65536;

    /**
     * @brief 选手程序的 RLIMIT_NPROC，0 表示不设置
     * 这个限制按真实用户统计所有进程和线程（包括 oibox 自身），只在选手程序 fork 时检查，
     * 因此 oibox 应该以专门的用户运行。root 用户不受限制。
     */
    int64_t max_processes = 256;
};

/**
 * @brief oibox 的全部配置，启动时加载一次，之后只读
 */
struct configuration {
    /**
     * @brief 沙箱根目录，必须是绝对路径
     */
    std::filesystem::path sandbox_root;

    compiler_config compiler;
    debugger_config debugger;
    execution_config execution;

    /**
     * @brief 为真时保留每次调用产生的源代码、可执行文件、输入输出文件，便于排查问题
     */
    bool keep_files = false;

    /**
     * @brief 处理 tools/call 的 worker 线程数
     */
    size_t workers = 2;
};

void from_json(const nlohmann::json &j, compiler_config &config);
void from_json(const nlohmann::json &j, debugger_config &config);
void from_json(const nlohmann::json &j, execution_config &config);
void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 从 JSON 配置文件中读取配置，并调用 validate_configuration 检查
 * @param file 配置文件路径
 * @param overrides 以 JSON merge patch 的形式覆盖配置文件中的字段
 * @throw configuration_error 文件不存在、JSON 格式错误、字段类型错误或者取值不合法
 */
configuration load_configuration(const std::filesystem::path &file, const nlohmann::json &overrides = nullptr);

/**
 * @brief 从 JSON 对象中读取配置，不检查
 * @throw configuration_error JSON 字段缺失或者类型错误
 */
configuration parse_configuration(const nlohmann::json &j);

/**
 * @brief 检查配置的取值是否合法
 * 包括沙箱根目录为绝对路径、编译器存在且可执行、各项限制为正数、默认值不超过最大值
 * @throw configuration_error
 */
void validate_configuration(const configuration &config);

}  // namespace oibox
