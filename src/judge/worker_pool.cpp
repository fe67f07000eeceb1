#include "judge/worker_pool.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <sched.h>
#include <string.h>
#include <algorithm>

namespace pocketjudge {
using namespace std;

worker_pool::worker_pool(size_t workers, bool pin_cores) {
    size_t cores = max(1u, thread::hardware_concurrency());
    if (workers == 0) workers = cores;

    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back([this, i] { worker_loop(i); });

        if (pin_cores) {
            // 要求操作系统将 worker 线程放在指定的 CPU 核心上运行
            cpu_set_t set;
            CPU_ZERO(&set);
            CPU_SET(i % cores, &set);
            int ret = pthread_setaffinity_np(threads.back().native_handle(), sizeof(cpu_set_t), &set);
            if (ret != 0)
                LOG(WARNING) << "Unable to pin worker " << i << " to core " << i % cores << ": " << strerror(ret);
        }
    }
    LOG(INFO) << "Started " << workers << " workers";
}

worker_pool::~worker_pool() {
    for (size_t i = 0; i < threads.size(); ++i)
        tasks.push(nullptr);
    for (auto &thd : threads)
        thd.join();
}

size_t worker_pool::size() const {
    return threads.size();
}

void worker_pool::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        function<void()> task = tasks.pop();
        if (!task) break;
        // packaged_task 会捕获任务抛出的异常，因此这里不会有异常
        task();
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace pocketjudge
