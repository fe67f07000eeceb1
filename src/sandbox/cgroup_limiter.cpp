#include "sandbox/cgroup_limiter.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include "common/utils.hpp"
#include "sandbox/cgroup.hpp"

namespace pocketjudge {
using namespace std;

struct cgroup_monitor : public process_monitor {
    cgroup_monitor(const string &cgroup_name, uint32_t memory_limit_mb)
        : cgroup_name(cgroup_name), guard(cgroup_name) {
        // 初始化 memory 资源管控器
        cgroup_ctrl memory = guard.add_controller("memory");
        int64_t memory_limit = memory_limit_mb > 0 ? (int64_t)memory_limit_mb << 20 : -1;
        memory.add_value("memory.limit_in_bytes", memory_limit);

        // 我们要统计选手程序的运行时间
        guard.add_controller("cpuacct");

        guard.create_cgroup(1);
        created = true;
    }

    ~cgroup_monitor() {
        if (!created) return;
        try {
            guard.delete_cgroup();
        } catch (cgroup_exception &e) {
            LOG(ERROR) << "Unable to delete cgroup " << cgroup_name << ": " << e.what();
        }
    }

    void attach(pid_t pid) override {
        guard.attach_task(pid);
    }

    uint64_t sample_memory_kb(pid_t pid) override {
        return read_peak_rss_kb(pid);
    }

    void kill_all(pid_t pid) override {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
        try {
            guard.kill_tasks();
        } catch (cgroup_exception &e) {
            LOG(ERROR) << "Unable to kill tasks of cgroup " << cgroup_name << ": " << e.what();
        }
    }

    void finish(pid_t pid, execution_result &result) override {
        // 杀死 cgroup 内所有的进程，以确保父进程结束后不会有进程残留
        kill_all(pid);

        cgroup_guard stats(cgroup_name);
        stats.get_cgroup();
        {
            cgroup_ctrl ctrl = stats.get_controller("memory");
            int64_t max_usage = ctrl.get_value_int64("memory.max_usage_in_bytes");
            result.memory_kb = max(result.memory_kb, (uint64_t)max_usage / 1024);
        }
        {
            cgroup_ctrl ctrl = stats.get_controller("cpuacct");
            int64_t cpu_time = ctrl.get_value_int64("cpuacct.usage");  // in ns
            result.cpu_time_ms = max(result.cpu_time_ms, cpu_time / 1e6);
        }

        ifstream fin("/sys/fs/cgroup/memory" + cgroup_name + "/memory.oom_control");
        stringstream oom_control;
        oom_control << fin.rdbuf();
        if (parse_oom_kill_count(oom_control.str()) > 0)
            result.memory_exceeded = true;
    }

private:
    string cgroup_name;
    cgroup_guard guard;
    bool created = false;
};

cgroup_limiter::cgroup_limiter(string parent) : parent(move(parent)) {}

string cgroup_limiter::name() const {
    return "cgroup";
}

uint64_t parse_oom_kill_count(const string &oom_control) {
    istringstream in(oom_control);
    string key;
    uint64_t value;
    while (in >> key >> value) {
        if (key == "oom_kill") return value;
    }
    return 0;
}

unique_ptr<process_monitor> cgroup_limiter::create_monitor(const run_options &options) const {
    cgroup_guard::init();
    return make_unique<cgroup_monitor>(parent + "/run_" + random_uuid(), options.memory_limit_mb);
}

}  // namespace pocketjudge
