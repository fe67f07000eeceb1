#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目信息
 * 包含：
 * 1. resource_limits 类（表示题目的资源限制）
 * 2. test_case 类（表示一个测试点）
 * 3. checker_config 类（表示题目使用的比较器）
 * 4. problem_config 类（表示一道题目）
 */
namespace pocketjudge {

/**
 * @brief 测试点所属的分类
 * 分类按照 SAMPLES、PRETESTS、SYSTEM 的顺序评测
 */
enum class category {
    /**
     * @brief 样例，题面中给出的数据
     */
    SAMPLES = 0,

    /**
     * @brief 预测试数据
     */
    PRETESTS = 1,

    /**
     * @brief 系统测试数据
     */
    SYSTEM = 2
};

/**
 * @brief 所有分类，按照评测顺序排列
 */
extern const std::vector<category> ALL_CATEGORIES;

/**
 * @brief 分类的名字，同时也是测试数据文件夹的名字，如 "pretests"
 */
const char *get_category_name(category cat);

/**
 * @brief 该分类下的单个测试点的称呼，如 "pretest"，用于 "Wrong Answer on pretest 3"
 */
const char *get_test_noun(category cat);

/**
 * @brief 根据名字解析分类
 * @throw std::invalid_argument 分类不存在
 */
category parse_category(const std::string &name);

/**
 * @brief 题目的资源限制，评测过程中不会修改
 */
struct resource_limits {
    std::uint32_t time_limit_ms = 1000;
    std::uint32_t memory_limit_mb = 256;
    std::uint32_t compile_timeout_s = 30;
};

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 测试点编号，在同一个分类中唯一
     */
    std::uint32_t ordinal = 0;

    /**
     * @brief 喂给选手程序 stdin 的输入数据
     */
    std::string input;

    /**
     * @brief 标准答案
     */
    std::string answer;

    category cat = category::SYSTEM;

    /**
     * @brief 是否找到了答案文件
     * 没有答案的测试点不会运行选手程序，直接判为评测错误
     */
    bool has_answer = true;
};

enum class checker_type {
    DIFF,
    FLOAT,
    SPECIAL_JUDGE
};

/**
 * @brief 题目的比较器配置
 */
struct checker_config {
    checker_type type = checker_type::DIFF;

    /**
     * @brief 浮点比较的绝对误差，必须是正的有限数
     */
    double float_abs_tol = 1e-6;

    /**
     * @brief 已经编译好的 special judge
     */
    std::filesystem::path spj_executable_path;

    /**
     * @brief special judge 的源代码，在评测时编译
     * spj_executable_path 存在时忽略该项
     */
    std::filesystem::path spj_source_path;
};

/**
 * @brief 表示一道题目
 */
struct problem_config {
    resource_limits limits;

    checker_config checker;

    /**
     * @brief 各个分类的测试点
     */
    std::map<category, std::vector<test_case>> tests;
};

void from_json(const nlohmann::json &j, resource_limits &limits);

void from_json(const nlohmann::json &j, checker_config &checker);

/**
 * @brief 从 problem.json 读取题目配置，不包含测试点
 * @throw std::invalid_argument 配置不合法，比如比较器类型不存在、误差不是正数
 */
void from_json(const nlohmann::json &j, problem_config &problem);

}  // namespace pocketjudge
