#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/checker.hpp"
#include "judge/compiler.hpp"
#include "judge/problem.hpp"
#include "judge/result.hpp"
#include "judge/test_runner.hpp"
#include "judge/worker_pool.hpp"
#include "sandbox/resource_limiter.hpp"

namespace pocketjudge {

struct judge_options {
    /**
     * @brief 某个分类没有通过时，是否跳过之后的分类
     */
    bool stop_on_failure = true;

    /**
     * @brief 需要评测的分类，评测顺序始终为 samples、pretests、system
     */
    std::vector<category> categories = ALL_CATEGORIES;
};

/**
 * @brief 评测引擎，负责一个提交的完整评测流程
 *
 * 评测流程：
 * 1. 编译选手程序，编译失败则直接返回 COMPILATION_ERROR；
 * 2. 准备比较器，special judge 不存在或编译失败时返回 JUDGE_ERROR；
 * 3. 依次评测 samples、pretests、system 分类，若 stop_on_failure 为真，
 *    某个分类没有通过时跳过之后的分类；
 * 4. 汇总结果：第一个没有通过的测试点的结果即为提交的结果。
 *
 * 评测引擎在两次评测之间没有状态（除了 worker 线程池），可以在多个线程中同时调用 judge。
 * 编译产物在评测结束时（包括发生异常时）被删除。
 */
struct judge_engine {
    judge_engine(const toolchain_config &config, std::shared_ptr<const resource_limiter> limiter, std::shared_ptr<worker_pool> pool);

    /**
     * @brief 评测一个提交
     * 不会抛出异常，评测系统的错误以 JUDGE_ERROR 返回
     * @param source 选手源代码
     * @param problem 题目配置及测试点
     * @param options 评测选项
     */
    submission_result judge(const std::string &source, const problem_config &problem, const judge_options &options = judge_options()) const;

    /**
     * @brief 使用自定义输入运行选手程序，不比较输出
     */
    custom_run_result run_custom(const std::string &source, const std::string &input, const resource_limits &limits) const;

    const toolchain_config &get_config() const;

private:
    checker prepare_checker(const checker_config &checker_conf, const resource_limits &limits, std::optional<compiled_artifact> &spj_artifact) const;

    toolchain_config config;
    std::shared_ptr<const resource_limiter> limiter;
    std::shared_ptr<worker_pool> pool;
    compiler source_compiler;
    compiler spj_compiler;
    test_runner runner;
};

}  // namespace pocketjudge
