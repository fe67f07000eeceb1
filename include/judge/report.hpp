#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "judge/result.hpp"

namespace pocketjudge {

void to_json(nlohmann::json &j, const test_result &result);

void to_json(nlohmann::json &j, const category_result &result);

void to_json(nlohmann::json &j, const compile_result &result);

void to_json(nlohmann::json &j, const statistics &stats);

void to_json(nlohmann::json &j, const timeline_entry &entry);

void to_json(nlohmann::json &j, const submission_result &result);

void to_json(nlohmann::json &j, const custom_run_result &result);

/**
 * @brief 将评测结果渲染为缩进的 json 字符串
 * 选手程序的输出可能不是合法的 UTF-8，非法字符会被替换为 U+FFFD
 */
std::string render_report(const nlohmann::json &report);

}  // namespace pocketjudge
