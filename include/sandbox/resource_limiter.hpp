#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pocketjudge {

/**
 * @brief 单次运行的资源限制
 */
struct run_limits {
    /**
     * @brief 时钟时间限制(ms)，超时后整个进程组会被 SIGKILL
     */
    std::uint32_t time_limit_ms = 1000;

    /**
     * @brief 内存限制(MB)，以峰值常驻内存计算，0 表示不限制
     */
    std::uint32_t memory_limit_mb = 256;

    /**
     * @brief 进程最多能写入的文件大小(KB)，0 表示不限制
     */
    std::uint64_t output_limit_kb = 65536;

    /**
     * @brief stderr 最多读回的字节数
     */
    std::size_t diagnostic_limit = 4096;
};

/**
 * @brief 启动进程所需的全部信息
 * 由 resource_limiter::run 根据 run_limits 生成，也可以直接构造
 */
struct run_options {
    /**
     * @brief 命令，command[0] 为可执行文件路径，不包含 '/' 时从 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录，为空时继承父进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 标准输入文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    std::filesystem::path stdout_file;

    /**
     * @brief 标准错误输出文件，可以和 stdout_file 相同，此时两者合并
     */
    std::filesystem::path stderr_file;

    std::uint32_t time_limit_ms = 1000;

    /**
     * @brief 内存限制(MB)，0 表示不限制
     */
    std::uint32_t memory_limit_mb = 0;

    /**
     * @brief 文件大小限制(bytes)，0 表示不限制
     */
    std::uint64_t file_limit_bytes = 0;
};

/**
 * @brief 一次受限运行的结果
 */
struct execution_result {
    /**
     * @brief 进程的返回值，若进程被信号终止，为 128 + 信号编号
     */
    int exit_code = 0;

    /**
     * @brief 终止进程的信号，0 表示进程正常退出
     */
    int signal = 0;

    std::string output;

    /**
     * @brief 标准错误输出，最多保留 diagnostic_limit 字节
     */
    std::string error_output;

    /**
     * @brief 时钟时间(ms)，超时的情况下不小于时间限制
     */
    double time_ms = 0;

    /**
     * @brief 用户态和内核态 CPU 时间之和(ms)
     */
    double cpu_time_ms = 0;

    /**
     * @brief 峰值常驻内存(KB)
     */
    std::uint64_t memory_kb = 0;

    bool timed_out = false;
    bool memory_exceeded = false;

    /**
     * @brief 非零返回值或者被信号终止
     * 与 timed_out、memory_exceeded 独立设置，超时被杀死的进程同样是 crashed
     */
    bool crashed = false;

    /**
     * @brief 输出达到了文件大小限制
     */
    bool output_truncated = false;
};

/**
 * @brief 资源限制器，负责在时间和内存限制下运行进程
 * 不同的实现对应不同的内核机制：
 * 1. rlimit：进程组 + setrlimit + /proc 采样
 * 2. cgroup：libcgroup 的 memory 和 cpuacct 控制器
 *
 * 实现必须是线程安全的，多个 worker 会同时调用同一个限制器。
 */
struct resource_limiter {
    virtual ~resource_limiter();

    /**
     * @brief 运行进程并等待其结束
     * 返回时进程及其创建的所有子进程都已经被杀死。
     * execution_result 的 output 和 error_output 为空，需要调用者自行读取输出文件。
     * @throw spawn_error 无法启动进程
     * @throw std::system_error 系统调用失败
     */
    virtual execution_result execute(const run_options &options) const = 0;

    /**
     * @brief 限制器的名字，如 "rlimit"
     */
    virtual std::string name() const = 0;

    /**
     * @brief 在 run_dir 中运行命令
     * 标准输入写入 <name>.in，标准输出和标准错误输出分别重定向到 <name>.out 和 <name>.err，
     * 运行结束后读回到 execution_result 中。
     * @param command 命令
     * @param stdin_content 标准输入的内容
     * @param limits 资源限制
     * @param run_dir 运行目录，必须已经存在
     * @param name 输入输出文件的文件名前缀
     */
    execution_result run(const std::vector<std::string> &command,
                         const std::string &stdin_content,
                         const run_limits &limits,
                         const std::filesystem::path &run_dir,
                         const std::string &name = "program") const;
};

/**
 * @brief 根据名字创建资源限制器
 * @param type "rlimit" 或 "cgroup"
 * @throw std::invalid_argument 限制器类型不存在
 */
std::shared_ptr<resource_limiter> make_resource_limiter(const std::string &type);

}  // namespace pocketjudge
