#pragma once

#include <sys/types.h>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace oibox {

/**
 * @brief 一次运行的资源限制
 */
struct run_limits {
    /**
     * @brief 墙上时间限制，单位为毫秒
     * 同时设置 RLIMIT_CPU 为向上取整的秒数加一秒
     */
    int64_t time_limit_ms = 5000;

    /**
     * @brief 内存限制，单位为 MB，0 表示不限制
     * 同时作为 RLIMIT_AS 和常驻内存监控的上限
     */
    int64_t memory_limit_mb = 256;

    /**
     * @brief 标准输出和标准错误合计的最大捕获长度，单位为字节
     */
    size_t max_output_size = 65536;

    /**
     * @brief RLIMIT_FSIZE，单位为字节，0 表示不限制
     */
    int64_t max_file_size = 0;

    /**
     * @brief RLIMIT_NPROC，0 表示不设置
     * 按真实用户统计进程数，执行选手程序时由 execution_config::max_processes 给出
     */
    int64_t max_processes = 0;
};

/**
 * @brief 取消标记，可以在任意线程中调用 cancel
 * 资源限制器会在 10ms 内杀死受控进程组
 */
struct cancellation_token {
    void cancel() noexcept;
    bool cancelled() const noexcept;

private:
    std::atomic<bool> flag{false};
};

/**
 * @brief 运行选项
 */
struct run_options {
    /**
     * @brief 子进程的工作目录，必须在沙箱内
     */
    std::filesystem::path working_directory;

    /**
     * @brief 子进程的环境变量（KEY=VALUE），不继承父进程的环境变量
     */
    std::vector<std::string> environment;

    /**
     * @brief 可选的取消标记
     */
    std::shared_ptr<cancellation_token> cancellation;
};

/**
 * @brief 受控进程的运行结果，超限时包含截断前的部分输出
 */
struct run_result {
    std::string output;  // 标准输出
    std::string error;   // 标准错误

    /**
     * @brief 进程返回值，因信号结束时为 128 + 信号
     */
    int exit_code = -1;

    /**
     * @brief 结束进程的信号，正常退出时为 0
     */
    int signal = 0;

    int64_t wall_time_ms = 0;
    int64_t cpu_time_ms = 0;

    /**
     * @brief 峰值常驻内存，单位为 KB，无法获得时为 -1
     */
    int64_t peak_memory_kb = -1;

    /**
     * @brief 读入的输出总字节数，包括被丢弃的部分
     */
    size_t output_bytes = 0;

    termination_cause cause = termination_cause::COMPLETED;

    pid_t pid = -1;
};

/**
 * @brief 当前平台支持的资源限制能力
 */
struct limiter_capabilities {
    /**
     * @brief 支持 RLIMIT_AS 限制地址空间
     */
    bool address_space_limit;

    /**
     * @brief 可以通过 /proc/<pid>/status 采样常驻内存
     */
    bool rss_sampling;

    /**
     * @brief 可以通过进程组杀死所有子孙进程
     */
    bool process_group_kill;

    /**
     * @brief 支持 RLIMIT_CPU
     */
    bool cpu_time_limit;
};

/**
 * @brief 在资源限制下运行外部程序
 * 子进程通过 fork + execve 启动，不经过 shell，处于独立的会话（进程组）中。
 * 运行期间看门狗线程负责墙上时间限制，内存监控线程负责常驻内存限制，
 * 调用线程负责标准输入输出的转发和输出长度限制，互不阻塞。
 * 本身没有状态，可以被多个线程同时使用。
 */
struct resource_limiter {
    virtual ~resource_limiter() = default;

    /**
     * @brief 运行程序直到结束，或者被资源限制器杀死
     * @param executable 可执行文件的绝对路径
     * @param args 参数（不含 argv[0]）
     * @param input 标准输入的全部内容，写完后关闭标准输入
     * @param limits 资源限制
     * @param options 工作目录、环境变量、取消标记
     * @return 运行结果
     * @throw invocation_cancelled 取消标记被触发，子进程已被杀死并回收
     * @throw std::system_error 无法启动进程等系统调用失败
     */
    virtual run_result run(const std::filesystem::path &executable,
                           const std::vector<std::string> &args,
                           const std::string &input,
                           const run_limits &limits,
                           const run_options &options = {}) const;

    /**
     * @brief 当前平台的能力
     */
    static limiter_capabilities capabilities();
};

}  // namespace oibox
