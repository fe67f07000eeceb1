#pragma once

#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace pocketjudge {

/**
 * @brief 固定大小的评测 worker 线程池
 * 每个 worker 从任务队列中取出测试点任务执行。
 * 开启 pin_cores 时 worker i 被绑定到 CPU 核心 i（按核心数取模），
 * 以减少线程迁移对时间计量的影响。
 *
 * 线程池可以被多个评测同时使用，但是不能在 worker 线程中等待 submit 返回的 future，
 * 否则所有 worker 都在等待时会死锁。
 */
struct worker_pool {
    /**
     * @param workers worker 数量，0 表示使用 CPU 核心数
     * @param pin_cores 是否将 worker 绑定到 CPU 核心
     */
    explicit worker_pool(std::size_t workers = 0, bool pin_cores = false);

    worker_pool(const worker_pool &) = delete;

    /**
     * @brief 停止所有 worker
     * 队列中已有的任务会被执行完
     */
    ~worker_pool();

    /**
     * @brief 提交一个任务
     * @return 任务的结果，任务抛出的异常会在 future::get 时重新抛出
     */
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F &&f) {
        typedef std::invoke_result_t<F> result_type;
        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
        std::future<result_type> future = task->get_future();
        tasks.push([task] { (*task)(); });
        return future;
    }

    std::size_t size() const;

private:
    void worker_loop(std::size_t worker_id);

    // 空任务表示 worker 需要退出
    concurrent_queue<std::function<void()>> tasks;
    std::vector<std::thread> threads;
};

}  // namespace pocketjudge
