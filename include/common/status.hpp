#pragma once

namespace oibox {

/**
 * @brief 受控进程的结束原因
 * 只记录第一次由资源限制器触发的干预，之后的干预不会覆盖
 */
enum class termination_cause {
    /**
     * @brief 进程自己退出，返回值可以非零
     */
    COMPLETED = 0,

    /**
     * @brief 超过墙上时间限制被杀死，或者因为 CPU 时间限制收到 SIGXCPU
     */
    TIMED_OUT = 1,

    /**
     * @brief 超过内存限制
     * 常驻内存超过限制时被监控线程杀死，或者在地址空间限制下分配内存失败而异常退出。
     * 这个判断是尽力而为的，参见 resource_limiter::capabilities
     */
    MEMORY_EXCEEDED = 2,

    /**
     * @brief 标准输出和标准错误的总长度超过上限，或者写文件超过 RLIMIT_FSIZE
     */
    OUTPUT_TRUNCATED = 3,

    /**
     * @brief 进程因为不是资源限制器发出的信号而结束，比如 SIGSEGV、SIGFPE、SIGABRT
     */
    CRASHED = 4
};

const char *to_string(termination_cause cause);

}  // namespace oibox
