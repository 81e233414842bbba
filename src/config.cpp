#include "config.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/compiler.hpp"
#include "sandbox/command_guard.hpp"
#include "sandbox/path_guard.hpp"

namespace oibox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

void from_json(const json &j, compiler_config &config) {
    string path;
    j.at("path").get_to(path);
    config.path = path;
    if (j.count("standard"))
        j.at("standard").get_to(config.standard);
    if (j.count("optimization"))
        j.at("optimization").get_to(config.optimization);
    if (j.count("flags"))
        j.at("flags").get_to(config.flags);
    if (j.count("time_limit_ms"))
        j.at("time_limit_ms").get_to(config.time_limit_ms);
    if (j.count("memory_limit_mb"))
        j.at("memory_limit_mb").get_to(config.memory_limit_mb);
    if (j.count("max_diagnostics_size"))
        j.at("max_diagnostics_size").get_to(config.max_diagnostics_size);
}

void from_json(const json &j, debugger_config &config) {
    if (j.count("path"))
        config.path = j.at("path").get<string>();
    if (j.count("time_limit_ms"))
        j.at("time_limit_ms").get_to(config.time_limit_ms);
    if (j.count("memory_limit_mb"))
        j.at("memory_limit_mb").get_to(config.memory_limit_mb);
}

void from_json(const json &j, execution_config &config) {
    if (j.count("default_time_limit_ms"))
        j.at("default_time_limit_ms").get_to(config.default_time_limit_ms);
    if (j.count("max_time_limit_ms"))
        j.at("max_time_limit_ms").get_to(config.max_time_limit_ms);
    if (j.count("default_memory_limit_mb"))
        j.at("default_memory_limit_mb").get_to(config.default_memory_limit_mb);
    if (j.count("max_memory_limit_mb"))
        j.at("max_memory_limit_mb").get_to(config.max_memory_limit_mb);
    if (j.count("max_output_size"))
        j.at("max_output_size").get_to(config.max_output_size);
    if (j.count("max_processes"))
        j.at("max_processes").get_to(config.max_processes);
}

void from_json(const json &j, configuration &config) {
    config.sandbox_root = j.at("sandbox_root").get<string>();
    j.at("compiler").get_to(config.compiler);
    if (j.count("debugger"))
        j.at("debugger").get_to(config.debugger);
    if (j.count("execution"))
        j.at("execution").get_to(config.execution);
    if (j.count("keep_files"))
        j.at("keep_files").get_to(config.keep_files);
    if (j.count("workers"))
        j.at("workers").get_to(config.workers);
}

configuration parse_configuration(const json &j) {
    try {
        return j.get<configuration>();
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("Malformed configuration: {}", e.what()));
    }
}

configuration load_configuration(const fs::path &file, const json &overrides) {
    if (!fs::is_regular_file(file))
        throw configuration_error(fmt::format("Configuration file {} does not exist", file.string()));

    json j;
    try {
        j = json::parse(read_file_content(file));
    } catch (json::parse_error &e) {
        throw configuration_error(fmt::format("Configuration file {} is malformed: {}", file.string(), e.what()));
    }

    // 命令行和环境变量的设置覆盖配置文件
    if (!overrides.is_null()) j.merge_patch(overrides);

    configuration config = parse_configuration(j);
    validate_configuration(config);
    LOG(INFO) << "Loaded configuration from " << file;
    return config;
}

static void check_positive(int64_t value, const char *name) {
    if (value <= 0)
        throw configuration_error(fmt::format("{} must be positive, got {}", name, value));
}

void validate_configuration(const configuration &config) {
    if (config.sandbox_root.empty() || !config.sandbox_root.is_absolute())
        throw configuration_error(fmt::format("sandbox_root must be an absolute path, got \"{}\"", config.sandbox_root.string()));
    if (config.sandbox_root == config.sandbox_root.root_path())
        throw configuration_error("sandbox_root must not be the filesystem root");

    if (!config.compiler.path.is_absolute())
        throw configuration_error(fmt::format("compiler.path must be an absolute path, got \"{}\"", config.compiler.path.string()));
    if (!fs::is_regular_file(config.compiler.path) || access(config.compiler.path.c_str(), X_OK) != 0)
        throw configuration_error(fmt::format("Compiler {} does not exist or is not executable", config.compiler.path.string()));

    if (!is_valid_standard(config.compiler.standard))
        throw configuration_error(fmt::format("compiler.standard \"{}\" is not a supported C++ standard", config.compiler.standard));
    if (!is_valid_optimization(config.compiler.optimization))
        throw configuration_error(fmt::format("compiler.optimization \"{}\" is not allowed", config.compiler.optimization));

    // 编译选项在每次编译时都会经过 command_guard，这里提前检查
    path_guard paths(config.sandbox_root);
    command_guard guard(config, paths);
    if (auto reason = guard.check(config.compiler.path, config.compiler.flags))
        throw configuration_error(fmt::format("compiler.flags rejected: {}", *reason));

    if (!config.debugger.path.is_absolute())
        throw configuration_error(fmt::format("debugger.path must be an absolute path, got \"{}\"", config.debugger.path.string()));
    if (!fs::is_regular_file(config.debugger.path))
        LOG(WARNING) << "Debugger " << config.debugger.path << " does not exist, debug_with_gdb will be unavailable";

    check_positive(config.compiler.time_limit_ms, "compiler.time_limit_ms");
    check_positive(static_cast<int64_t>(config.compiler.max_diagnostics_size), "compiler.max_diagnostics_size");
    check_positive(config.debugger.time_limit_ms, "debugger.time_limit_ms");
    if (config.compiler.memory_limit_mb < 0 || config.debugger.memory_limit_mb < 0)
        throw configuration_error("memory_limit_mb of compiler and debugger must not be negative");

    auto &exec = config.execution;
    check_positive(exec.default_time_limit_ms, "execution.default_time_limit_ms");
    check_positive(exec.max_time_limit_ms, "execution.max_time_limit_ms");
    check_positive(exec.default_memory_limit_mb, "execution.default_memory_limit_mb");
    check_positive(exec.max_memory_limit_mb, "execution.max_memory_limit_mb");
    check_positive(static_cast<int64_t>(exec.max_output_size), "execution.max_output_size");
    if (exec.max_processes < 0)
        throw configuration_error("execution.max_processes must not be negative");
    if (exec.default_time_limit_ms > exec.max_time_limit_ms)
        throw configuration_error("execution.default_time_limit_ms exceeds execution.max_time_limit_ms");
    if (exec.default_memory_limit_mb > exec.max_memory_limit_mb)
        throw configuration_error("execution.default_memory_limit_mb exceeds execution.max_memory_limit_mb");

    if (config.workers == 0)
        throw configuration_error("workers must be positive");
}

}  // namespace oibox
