#pragma once

#include <ostream>
#include <string>

namespace pocketjudge {

/**
 * @brief 表示单个测试点、测试分类或整个提交的评测结果
 * 每个测试点恰好一个评测结果，每个测试分类恰好一个汇总结果，每个提交恰好一个最终结果。
 */
enum class verdict {
    /**
     * @brief 用户程序本测试点评测通过
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 比较器认为选手输出与标准答案不一致，或者选手输出多余/缺少内容。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 按时钟时间（wall time）计算，超时后整个进程组会被 SIGKILL 强制结束。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * 以峰值常驻内存计算，而不是平均值。
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 非零返回值或者因为信号（SIGSEGV、SIGFPE、SIGABRT、SIGXFSZ 等）终止。
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 格式错误
     * 只有 special judge 能返回该结果，diff 和 float 比较器永远不会返回 PE。
     */
    PRESENTATION_ERROR = 5,

    /**
     * @brief 用户程序编译错误
     * 编译失败或编译超时，此时不会运行任何测试点。
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 评测系统内部错误
     * 比如无法启动进程、special judge 缺失/崩溃/超时、文件读写失败。
     * 这个结果表示评测系统本身的问题，与选手程序无关。
     */
    JUDGE_ERROR = 7
};

/**
 * @brief 获得评测结果的完整名称，比如 "Wrong Answer"
 */
const char *get_display_message(verdict);

/**
 * @brief 获得评测结果的缩写，比如 "WA"
 */
const char *get_short_name(verdict);

/**
 * @brief 根据缩写解析评测结果
 * @throw std::invalid_argument 缩写不存在
 */
verdict parse_verdict(const std::string &short_name);

std::ostream &operator<<(std::ostream &os, verdict v);

}  // namespace pocketjudge
