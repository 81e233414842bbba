#include "sandbox/resource_limiter.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <fstream>
#include <limits>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace oibox {
using namespace std;
namespace fs = std::filesystem;

static const size_t BUF_SIZE = 4096;

// 输入输出转发、看门狗、内存采样的轮询间隔
static const chrono::milliseconds POLL_INTERVAL(10);

// 子进程退出后继续读取管道的最长时间，子孙进程可能还持有管道
static const chrono::milliseconds DRAIN_TIMEOUT(100);

static const char *DEFAULT_PATH = "PATH=/usr/local/bin:/usr/bin:/bin";

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), forward<Args>(args)...));
}

void cancellation_token::cancel() noexcept {
    flag = true;
}

bool cancellation_token::cancelled() const noexcept {
    return flag;
}

/**
 * @brief 管道的一端，析构时关闭
 */
struct pipe_end {
    int fd = -1;

    pipe_end() = default;
    pipe_end(const pipe_end &) = delete;
    pipe_end &operator=(const pipe_end &) = delete;
    ~pipe_end() { reset(); }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }

    explicit operator bool() const { return fd >= 0; }
};

static void make_pipe(pipe_end &read_end, pipe_end &write_end) {
    int fds[2];
    // O_CLOEXEC 避免并发 fork 的其他子进程在 exec 后继续持有管道
    if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "unable to create pipe");
    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        error(errno, "unable to set O_NONBLOCK on fd {}", fd);
}

static void kill_group(pid_t pid) {
    // 进程组可能已经不存在了，不把 ESRCH 当作错误
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        int err = errno;
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << generic_category().message(err);
    }
}

static void reap(pid_t pid, int *status, struct rusage *usage) {
    while (wait4(pid, status, 0, usage) < 0) {
        if (errno != EINTR) error(errno, "unable to wait for process {}", pid);
    }
}

static void ignore_sigpipe() {
    // 子进程关闭标准输入后父进程写入时不能被 SIGPIPE 杀死
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

enum child_step {
    STEP_SIGNAL = 0,
    STEP_SETSID,
    STEP_REDIRECT,
    STEP_CHDIR,
    STEP_RLIMIT,
    STEP_EXEC
};

static const char *child_step_names[] = {
    "reset signal mask", "setsid", "redirect standard streams",
    "change working directory", "set resource limits", "execve"};

/**
 * @brief 子进程 exec 之前失败时写入报告管道的内容
 */
struct child_failure {
    int step;
    int err;
};

/**
 * @brief fork 之前准备好子进程需要的所有数据
 * fork 之后子进程只能调用异步信号安全的函数，不能再分配内存
 */
struct child_setup {
    vector<string> argv_storage;
    vector<string> env_storage;
    vector<char *> argv;
    vector<char *> envp;
    string working_directory;
    vector<pair<int, struct rlimit>> rlimits;
    int stdin_fd = -1, stdout_fd = -1, stderr_fd = -1, report_fd = -1;
};

static bool redirect(int fd, int target) {
    if (fd == target) {
        // dup2 不会清除同一个 fd 上的 FD_CLOEXEC
        int flags = fcntl(fd, F_GETFD);
        return flags >= 0 && fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) >= 0;
    }
    return dup2(fd, target) >= 0;
}

[[noreturn]] static void child_exit(const child_setup &setup, int step) noexcept {
    child_failure failure = {step, errno};
    ssize_t written = write(setup.report_fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

[[noreturn]] static void child_main(const child_setup &setup) noexcept {
    // 恢复默认的信号处理方式，被忽略的信号在 exec 后仍然会被忽略
    struct sigaction action;
    action.sa_handler = SIG_DFL;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (int sig = 1; sig < NSIG; ++sig)
        sigaction(sig, &action, nullptr);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) child_exit(setup, STEP_SIGNAL);

    // 在新的会话中运行，这样命令和它的所有子进程都可以通过一个信号杀死
    if (setsid() == -1) child_exit(setup, STEP_SETSID);

    if (!redirect(setup.stdin_fd, STDIN_FILENO) ||
        !redirect(setup.stdout_fd, STDOUT_FILENO) ||
        !redirect(setup.stderr_fd, STDERR_FILENO))
        child_exit(setup, STEP_REDIRECT);

    if (!setup.working_directory.empty() && chdir(setup.working_directory.c_str()) != 0)
        child_exit(setup, STEP_CHDIR);

    for (auto &[resource, limit] : setup.rlimits)
        if (setrlimit(resource, &limit) != 0) child_exit(setup, STEP_RLIMIT);

    execve(setup.argv[0], setup.argv.data(), setup.envp.data());
    child_exit(setup, STEP_EXEC);
}

/**
 * @brief 读取 /proc/<pid>/status 中的内存使用，单位为 KB
 */
struct memory_sample {
    int64_t rss_kb = -1;
    int64_t peak_vm_kb = -1;
};

static memory_sample sample_memory(pid_t pid) {
    memory_sample sample;
    ifstream fin(fmt::format("/proc/{}/status", pid));
    string key;
    while (fin >> key) {
        if (key == "VmRSS:")
            fin >> sample.rss_kb;
        else if (key == "VmPeak:")
            fin >> sample.peak_vm_kb;
        fin.ignore(numeric_limits<streamsize>::max(), '\n');
    }
    return sample;
}

/**
 * @brief 看门狗线程、内存监控线程和转发线程共享的状态，由 mut 保护
 */
struct supervision {
    mutex mut;
    condition_variable cond;
    pid_t pid = -1;

    // 子进程已经退出或者转发已经结束，监控线程应当退出
    bool finished = false;
    bool cancelled = false;
    optional<termination_cause> cause;
    int64_t peak_rss_kb = -1;
    int64_t peak_vm_kb = -1;

    /**
     * @brief 记录干预原因并杀死进程组，只有第一次的原因会被记录
     * 调用者必须持有 mut
     */
    void intervene(termination_cause reason) {
        if (!cause) {
            cause = reason;
            LOG(INFO) << "Killing process group " << pid << ": " << to_string(reason);
        }
        kill_group(pid);
    }
};

static vector<pair<int, struct rlimit>> build_rlimits(const run_limits &limits) {
    vector<pair<int, struct rlimit>> result;
    auto add = [&](int resource, rlim_t soft, rlim_t hard) {
        // 非特权进程不能提高硬限制，超过当前硬限制的值被截断
        struct rlimit current;
        if (getrlimit(resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
            soft = min(soft, current.rlim_max);
            hard = min(hard, current.rlim_max);
        }
        struct rlimit lim;
        lim.rlim_cur = soft;
        lim.rlim_max = hard;
        result.emplace_back(resource, lim);
    };

    // 在软限制时内核发送 SIGXCPU，硬限制时发送 SIGKILL，
    // SIGXCPU 默认不会被捕获，可以可靠地判断是否超过了 CPU 时间限制
    rlim_t cputime_limit = (rlim_t)ceil(limits.time_limit_ms / 1000.0) + 1;
    add(RLIMIT_CPU, cputime_limit, cputime_limit + 1);

    if (limits.memory_limit_mb > 0) {
        rlim_t bytes = (rlim_t)limits.memory_limit_mb * 1024 * 1024;
#ifdef RLIMIT_AS
        add(RLIMIT_AS, bytes, bytes);
#endif
        add(RLIMIT_STACK, bytes, bytes);
    }

    if (limits.max_file_size > 0) add(RLIMIT_FSIZE, limits.max_file_size, limits.max_file_size);
    if (limits.max_processes > 0) add(RLIMIT_NPROC, limits.max_processes, limits.max_processes);
    add(RLIMIT_CORE, 0, 0);
    return result;
}

run_result resource_limiter::run(const fs::path &executable,
                                 const vector<string> &args,
                                 const string &input,
                                 const run_limits &limits,
                                 const run_options &options) const {
    if (limits.time_limit_ms <= 0)
        throw validation_error(fmt::format("Time limit must be positive, got {}", limits.time_limit_ms));
    if (limits.memory_limit_mb < 0)
        throw validation_error(fmt::format("Memory limit must not be negative, got {}", limits.memory_limit_mb));
    if (limits.max_output_size == 0)
        throw validation_error("Output limit must be positive");

    ignore_sigpipe();

    child_setup setup;
    setup.argv_storage.push_back(executable.string());
    setup.argv_storage.insert(setup.argv_storage.end(), args.begin(), args.end());
    for (auto &arg : setup.argv_storage) setup.argv.push_back(arg.data());
    setup.argv.push_back(nullptr);

    bool has_path = false;
    for (auto &env : options.environment) {
        if (boost::algorithm::starts_with(env, "PATH=")) has_path = true;
        setup.env_storage.push_back(env);
    }
    if (!has_path) setup.env_storage.push_back(DEFAULT_PATH);
    for (auto &env : setup.env_storage) setup.envp.push_back(env.data());
    setup.envp.push_back(nullptr);

    setup.working_directory = options.working_directory.string();
    setup.rlimits = build_rlimits(limits);

    pipe_end stdin_read, stdin_write, stdout_read, stdout_write, stderr_read, stderr_write, report_read, report_write;
    make_pipe(stdin_read, stdin_write);
    make_pipe(stdout_read, stdout_write);
    make_pipe(stderr_read, stderr_write);
    make_pipe(report_read, report_write);
    setup.stdin_fd = stdin_read.fd;
    setup.stdout_fd = stdout_write.fd;
    setup.stderr_fd = stderr_write.fd;
    setup.report_fd = report_write.fd;

    pid_t pid = fork();
    if (pid == -1) error(errno, "unable to fork");
    if (pid == 0) child_main(setup);

    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    report_write.reset();

    // 报告管道在 exec 成功时因为 O_CLOEXEC 被关闭，读到 EOF
    child_failure failure;
    ssize_t nread;
    do {
        nread = read(report_read.fd, &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);
    if (nread == sizeof(failure)) {
        reap(pid, nullptr, nullptr);
        error(failure.err, "unable to start {}: {} failed", executable.string(), child_step_names[failure.step]);
    }
    report_read.reset();

    set_nonblocking(stdout_read.fd);
    set_nonblocking(stderr_read.fd);
    set_nonblocking(stdin_write.fd);
    if (input.empty()) stdin_write.reset();

    bool reaped = false;
    defer {
        if (!reaped) {
            kill_group(pid);
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
    };

    supervision state;
    state.pid = pid;
    auto start = chrono::steady_clock::now();
    auto deadline = start + chrono::milliseconds(limits.time_limit_ms);
    int64_t memory_limit_kb = limits.memory_limit_mb * 1024;
    auto caps = capabilities();

    thread watchdog, monitor;
    auto stop_threads = [&] {
        {
            lock_guard<mutex> lock(state.mut);
            state.finished = true;
        }
        state.cond.notify_all();
        if (watchdog.joinable()) watchdog.join();
        if (monitor.joinable()) monitor.join();
    };
    defer { stop_threads(); };

    watchdog = thread([&] {
        unique_lock<mutex> lock(state.mut);
        while (!state.finished) {
            if (options.cancellation && options.cancellation->cancelled()) {
                LOG(INFO) << "Invocation cancelled, killing process group " << pid;
                state.cancelled = true;
                kill_group(pid);
                break;
            }
            auto now = chrono::steady_clock::now();
            if (now >= deadline) {
                state.intervene(termination_cause::TIMED_OUT);
                break;
            }
            state.cond.wait_until(lock, min(deadline, now + POLL_INTERVAL));
        }
    });

    if (caps.rss_sampling) {
        monitor = thread([&] {
            unique_lock<mutex> lock(state.mut);
            while (!state.finished) {
                lock.unlock();
                memory_sample sample = sample_memory(pid);
                lock.lock();
                if (state.finished) break;
                state.peak_rss_kb = max(state.peak_rss_kb, sample.rss_kb);
                state.peak_vm_kb = max(state.peak_vm_kb, sample.peak_vm_kb);
                if (memory_limit_kb > 0 && sample.rss_kb > memory_limit_kb) {
                    state.intervene(termination_cause::MEMORY_EXCEEDED);
                    break;
                }
                state.cond.wait_for(lock, POLL_INTERVAL);
            }
        });
    }

    run_result result;
    result.pid = pid;
    size_t captured = 0, input_written = 0;
    char buf[BUF_SIZE];

    auto capture = [&](pipe_end &from, string &to) {
        ssize_t n = read(from.fd, buf, BUF_SIZE);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, "unable to read output of process {}", pid);
        }
        if (n == 0) {
            from.reset();
            return;
        }
        result.output_bytes += n;
        size_t keep = min((size_t)n, limits.max_output_size - captured);
        to.append(buf, keep);
        captured += keep;
        if (keep < (size_t)n) {
            // 丢弃超出部分，但是继续读取直到管道关闭
            lock_guard<mutex> lock(state.mut);
            state.intervene(termination_cause::OUTPUT_TRUNCATED);
        }
    };

    auto feed = [&] {
        size_t to_write = min(input.size() - input_written, BUF_SIZE * 16);
        ssize_t n = write(stdin_write.fd, input.data() + input_written, to_write);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
            // 子进程不读取剩余的输入
            if (errno == EPIPE) {
                stdin_write.reset();
                return;
            }
            error(errno, "unable to write input of process {}", pid);
        }
        input_written += n;
        if (input_written == input.size()) stdin_write.reset();
    };

    bool exited = false;
    chrono::steady_clock::time_point exit_time;
    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_read) {
            out_idx = nfds;
            fds[nfds++] = {stdout_read.fd, POLLIN, 0};
        }
        if (stderr_read) {
            err_idx = nfds;
            fds[nfds++] = {stderr_read.fd, POLLIN, 0};
        }
        if (stdin_write) {
            in_idx = nfds;
            fds[nfds++] = {stdin_write.fd, POLLOUT, 0};
        }

        int ready = poll(fds, nfds, POLL_INTERVAL.count());
        if (ready < 0 && errno != EINTR) error(errno, "unable to poll pipes of process {}", pid);
        if (ready > 0) {
            if (out_idx >= 0 && fds[out_idx].revents) capture(stdout_read, result.output);
            if (err_idx >= 0 && fds[err_idx].revents) capture(stderr_read, result.error);
            if (in_idx >= 0 && fds[in_idx].revents) feed();
        }

        auto now = chrono::steady_clock::now();
        if (!exited) {
            siginfo_t info;
            info.si_pid = 0;
            // WNOWAIT 使得子进程保持僵尸状态，进程组编号在杀死子孙进程之前不会被复用
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
                if (errno != EINTR) error(errno, "unable to wait for process {}", pid);
            } else if (info.si_pid == pid) {
                exited = true;
                exit_time = now;
                stdin_write.reset();
                {
                    lock_guard<mutex> lock(state.mut);
                    state.finished = true;
                }
                state.cond.notify_all();
            }
        }
        if (exited && ((!stdout_read && !stderr_read) || now - exit_time >= DRAIN_TIMEOUT))
            break;
    }

    stop_threads();

    // 杀死仍然存活的子孙进程，保证它们不会比本次调用活得更久
    kill_group(pid);
    int status = 0;
    struct rusage usage;
    reap(pid, &status, &usage);
    reaped = true;

    result.wall_time_ms = chrono::duration_cast<chrono::milliseconds>(exit_time - start).count();
    result.cpu_time_ms = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
                         (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
    // Linux 下 ru_maxrss 的单位为 KB
    result.peak_memory_kb = usage.ru_maxrss > 0 ? (int64_t)usage.ru_maxrss : state.peak_rss_kb;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }

    if (state.cancelled)
        throw invocation_cancelled(fmt::format("Execution of {} was cancelled", executable.filename().string()));

    if (state.cause) {
        result.cause = *state.cause;
    } else if (WIFSIGNALED(status)) {
        int64_t cpu_limit_ms = (int64_t)ceil(limits.time_limit_ms / 1000.0) * 1000 + 1000;
        bool near_memory_limit = memory_limit_kb > 0 && state.peak_vm_kb >= memory_limit_kb / 10 * 9;
        if (result.signal == SIGXCPU || (result.signal == SIGKILL && result.cpu_time_ms >= cpu_limit_ms))
            result.cause = termination_cause::TIMED_OUT;
        else if (result.signal == SIGXFSZ)
            result.cause = termination_cause::OUTPUT_TRUNCATED;
        else if (memory_limit_kb > 0 && (boost::algorithm::contains(result.error, "std::bad_alloc") || near_memory_limit))
            result.cause = termination_cause::MEMORY_EXCEEDED;
        else
            result.cause = termination_cause::CRASHED;
    } else {
        result.cause = termination_cause::COMPLETED;
    }

    LOG(INFO) << fmt::format("{} finished: {}, exitcode {}, real {}ms, cpu {}ms, memory {}KB",
                             executable.filename().string(), to_string(result.cause), result.exit_code,
                             result.wall_time_ms, result.cpu_time_ms, result.peak_memory_kb);
    return result;
}

limiter_capabilities resource_limiter::capabilities() {
    limiter_capabilities caps;
#ifdef RLIMIT_AS
    caps.address_space_limit = true;
#else
    caps.address_space_limit = false;
#endif
    caps.rss_sampling = fs::exists("/proc/self/status");
    caps.process_group_kill = true;
    caps.cpu_time_limit = true;
    return caps;
}

}  // namespace oibox
