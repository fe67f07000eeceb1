#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include "common/verdict.hpp"
#include "sandbox/resource_limiter.hpp"

namespace pocketjudge {

/**
 * @brief 比较器的结果
 * verdict 只可能是 ACCEPTED、WRONG_ANSWER、PRESENTATION_ERROR、JUDGE_ERROR
 */
struct check_result {
    verdict status;
    std::string detail;
};

/**
 * @brief 逐行比较，忽略行末空白和文末空行
 * 每一行删除行末的空格、制表符和 \r，然后删除末尾的空行，之后逐行比较。
 * 不会返回 PRESENTATION_ERROR。
 */
struct diff_checker {
    check_result check(const std::string &input, const std::string &output, const std::string &answer, const std::filesystem::path &run_dir) const;
};

/**
 * @brief 按空白切分后逐个比较，数字允许绝对误差
 */
struct float_checker {
    /**
     * @brief 绝对误差，|a - b| <= abs_tolerance 视为相等
     */
    double abs_tolerance = 1e-6;

    check_result check(const std::string &input, const std::string &output, const std::string &answer, const std::filesystem::path &run_dir) const;
};

/**
 * @brief 调用外部程序比较
 * 在运行目录中写入 input.txt、output.txt、answer.txt，调用
 *     <spj> <input> <output> <answer>
 * 返回值 0 表示通过，1 表示答案错误，2 表示格式错误（与 testlib 的 _ok、_wa、_pe 一致），
 * 其他返回值、被信号终止、超时、内存超限、无法启动都是评测系统错误。
 */
struct special_judge_checker {
    std::filesystem::path executable;

    /**
     * @brief special judge 自身的资源限制
     */
    run_limits limits;

    std::shared_ptr<const resource_limiter> limiter;

    check_result check(const std::string &input, const std::string &output, const std::string &answer, const std::filesystem::path &run_dir) const;
};

typedef std::variant<diff_checker, float_checker, special_judge_checker> checker;

/**
 * @brief 比较选手输出和标准答案
 * 只会在选手程序正常结束（没有超时、内存超限、运行时错误）时调用
 * @param c 比较器
 * @param input 输入数据
 * @param output 选手输出
 * @param answer 标准答案
 * @param run_dir 运行目录，special judge 在这里写入临时文件
 */
check_result check(const checker &c, const std::string &input, const std::string &output, const std::string &answer, const std::filesystem::path &run_dir);

/**
 * @brief 比较器的名字，如 "diff"
 */
const char *get_checker_name(const checker &c);

}  // namespace pocketjudge
