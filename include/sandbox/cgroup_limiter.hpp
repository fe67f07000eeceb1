#pragma once

#include <string>
#include "sandbox/rlimit_limiter.hpp"

namespace pocketjudge {

/**
 * @brief 基于 cgroup v1 的资源限制器
 * 每次运行都会创建 <parent>/run_<uuid> 控制组，添加 memory 和 cpuacct 控制器，
 * 由父进程在子进程执行命令之前将其移入控制组。
 * 内存峰值从 memory.max_usage_in_bytes 读取，是否发生 OOM 从 memory.oom_control 读取。
 * 运行结束后杀死控制组中的所有进程并删除控制组。
 *
 * 需要 root 权限，以及挂载在 /sys/fs/cgroup 下的 cgroup v1 层级。
 */
struct cgroup_limiter : public rlimit_limiter {
    explicit cgroup_limiter(std::string parent = "/pocketjudge");

    std::string name() const override;

protected:
    std::unique_ptr<process_monitor> create_monitor(const run_options &options) const override;

private:
    std::string parent;
};

/**
 * @brief 从 memory.oom_control 的内容中读取 oom_kill 计数
 * @param oom_control 形如 "oom_kill_disable 0\nunder_oom 0\noom_kill 1\n" 的文件内容
 * @return 没有 oom_kill 字段时（旧内核）返回 0
 */
std::uint64_t parse_oom_kill_count(const std::string &oom_control);

}  // namespace pocketjudge
