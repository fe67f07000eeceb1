#pragma once

#include <vector>
#include "judge/checker.hpp"
#include "judge/compiler.hpp"
#include "judge/problem.hpp"
#include "judge/result.hpp"
#include "judge/test_runner.hpp"
#include "judge/worker_pool.hpp"

namespace pocketjudge {

/**
 * @brief 评测一个分类的所有测试点
 * 分类中的测试点全部都会被评测，不会因为某个测试点没有通过而停止。
 * 测试点被并发分发给 worker_pool，结果按测试点编号升序排列，与完成顺序无关。
 */
struct category_runner {
    category_runner(const test_runner &runner, worker_pool &pool);

    /**
     * @brief 评测分类 cat 中的测试点
     * @throw std::invalid_argument 测试点编号重复，此时不会评测任何测试点
     */
    category_result run(category cat, const compiled_artifact &artifact, std::vector<test_case> tests,
                        const resource_limits &limits, const checker &c) const;

    /**
     * @brief 检查测试点编号是否重复
     * @throw std::invalid_argument 测试点编号重复
     */
    static void validate(category cat, const std::vector<test_case> &tests);

private:
    const test_runner &runner;
    worker_pool &pool;
};

}  // namespace pocketjudge
