#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/verdict.hpp"
#include "judge/problem.hpp"

namespace pocketjudge {

/**
 * @brief 单个测试点的评测结果
 */
struct test_result {
    std::uint32_t ordinal = 0;

    verdict status = verdict::JUDGE_ERROR;

    /**
     * @brief 选手程序运行的时钟时间(ms)
     */
    double time_ms = 0;

    /**
     * @brief 选手程序的峰值内存(KB)
     */
    std::uint64_t memory_kb = 0;

    /**
     * @brief 比较器或评测系统给出的说明
     * 比如 line 2: expected "2", found "3"
     */
    std::string detail;

    int exit_code = 0;

    /**
     * @brief 选手程序的 stderr（已截断）
     */
    std::string error_log;
};

/**
 * @brief 一个分类的评测结果
 */
struct category_result {
    category cat = category::SYSTEM;

    /**
     * @brief 测试点结果，按编号升序排列
     */
    std::vector<test_result> tests;

    std::uint32_t passed = 0;
    std::uint32_t failed = 0;
    double total_time_ms = 0;
    double max_time_ms = 0;
    std::uint64_t max_memory_kb = 0;

    /**
     * @brief 第一个没有通过的测试点的结果，全部通过时为 ACCEPTED
     */
    verdict status = verdict::ACCEPTED;
};

struct compile_result {
    bool success = false;

    /**
     * @brief 编译器的输出（已截断）
     */
    std::string output;

    double time_ms = 0;
};

/**
 * @brief 整个提交的统计信息
 */
struct statistics {
    std::uint32_t total = 0;
    std::uint32_t passed = 0;
    std::uint32_t failed = 0;
    double total_time_ms = 0;
    double max_time_ms = 0;
    std::uint64_t max_memory_kb = 0;

    /**
     * @brief 通过率，百分数，保留一位小数，没有测试点时为 0
     */
    double pass_rate = 0;
};

/**
 * @brief 评测的阶段
 * COMPILING → RUNNING_SAMPLES → RUNNING_PRETESTS → RUNNING_SYSTEM → AGGREGATING → DONE
 * 编译错误时从 COMPILING 直接进入 DONE
 */
enum class judge_stage {
    COMPILING,
    RUNNING_SAMPLES,
    RUNNING_PRETESTS,
    RUNNING_SYSTEM,
    AGGREGATING,
    DONE
};

const char *get_stage_name(judge_stage stage);

/**
 * @brief 评测进入某个阶段的时刻，从评测开始计时
 */
struct timeline_entry {
    judge_stage stage;
    double elapsed_ms;
};

/**
 * @brief 第一个没有通过的测试点
 */
struct failure_point {
    category cat;
    std::uint32_t ordinal;
};

/**
 * @brief 提交的评测结果
 */
struct submission_result {
    verdict overall = verdict::JUDGE_ERROR;

    std::optional<failure_point> first_failure;

    compile_result compile;

    /**
     * @brief 实际评测了的分类
     */
    std::map<category, category_result> categories;

    statistics stats;

    /**
     * @brief 是否因为前面的分类没有通过而跳过了后面的分类
     */
    bool stopped_early = false;

    /**
     * @brief 评测系统错误的原因
     */
    std::string detail;

    std::vector<timeline_entry> timeline;

    /**
     * @brief 人类可读的评测结果，如 "Wrong Answer on pretest 3"
     */
    std::string summary() const;
};

/**
 * @brief 自定义输入运行的结果
 */
struct custom_run_result {
    compile_result compile;

    /**
     * @brief 运行结果，编译失败时为空
     */
    std::optional<test_result> run;

    verdict status = verdict::JUDGE_ERROR;

    /**
     * @brief 评测系统错误的原因
     */
    std::string detail;
};

}  // namespace pocketjudge
