#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include "sandbox/resource_limiter.hpp"

namespace pocketjudge {

/**
 * @brief 监控一个受限进程（及其子进程）的资源使用
 * 每次运行都会创建一个新的监控器，生命周期覆盖整个运行过程。
 */
struct process_monitor {
    virtual ~process_monitor();

    /**
     * @brief 子进程已经 fork，但还没有开始执行命令
     * 在这里可以把子进程移入 cgroup 等
     */
    virtual void attach(pid_t pid) = 0;

    /**
     * @brief 采样当前的峰值内存(KB)
     * 在等待子进程退出时每个时间片调用一次
     */
    virtual std::uint64_t sample_memory_kb(pid_t pid) = 0;

    /**
     * @brief 杀死受控的全部进程
     * 进程已经不存在时不能报错
     */
    virtual void kill_all(pid_t pid) = 0;

    /**
     * @brief 子进程已经退出，补充统计信息
     * 返回时所有子进程都已被杀死
     */
    virtual void finish(pid_t pid, execution_result &result) = 0;
};

/**
 * @brief 基于进程组与 setrlimit 的资源限制器
 *
 * 子进程在 fork 之后：
 * 1. 通过 setpgid 移入新的进程组，这样超时后可以一次性杀死进程及其子进程；
 * 2. 设置 RLIMIT_CPU = ceil(时间限制) + 1 秒，收到 SIGXCPU 说明 CPU 时间超限；
 * 3. 设置 RLIMIT_FSIZE、RLIMIT_CORE = 0 以及 RLIMIT_STACK；
 * 4. 等待父进程完成 attach，然后 execve。
 * execve 失败时，错误码通过带有 O_CLOEXEC 标记的管道传回父进程，父进程抛出 spawn_error。
 *
 * 父进程每 2ms 调用一次 wait4(WNOHANG)，同时采样 /proc/<pid>/status 中的 VmHWM。
 * 时钟时间超限或者内存超限时，整个进程组会被 SIGKILL。
 *
 * 内存限制只通过采样与 ru_maxrss 来判定，不设置 RLIMIT_AS，
 * 否则一次性申请大块内存的程序会因为分配失败而崩溃，被判为运行错误。
 */
struct rlimit_limiter : public resource_limiter {
    execution_result execute(const run_options &options) const override;

    std::string name() const override;

protected:
    /**
     * @brief 为一次运行创建监控器
     */
    virtual std::unique_ptr<process_monitor> create_monitor(const run_options &options) const;
};

/**
 * @brief 从 /proc/<pid>/status 中读取进程的 VmHWM(KB)
 * @return 进程不存在或者字段不存在时返回 0
 */
std::uint64_t read_peak_rss_kb(pid_t pid);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param command 不包含 '/' 的命令名，包含 '/' 时原样返回
 * @return 可执行文件的路径，找不到时返回空串
 */
std::string find_executable(const std::string &command);

}  // namespace pocketjudge
