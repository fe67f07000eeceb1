#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pocketjudge {

/**
 * @brief 按空白字符（空格、制表符、换行、回车）切分字符串，忽略空串
 */
std::vector<std::string> split_whitespace(const std::string &s);

/**
 * @brief 按行切分字符串，只认 '\n' 为行分隔符
 * 末尾的换行符不会产生额外的空行
 */
std::vector<std::string> split_lines(const std::string &s);

/**
 * @brief 字符串是否非空且只由 ASCII 数字组成
 */
bool is_integer(const std::string &s);

/**
 * @brief 将整个字符串解析为有限的浮点数
 * @return 若 s 不是一个完整的数字，或者是 inf/nan，返回空
 */
std::optional<double> parse_number(const std::string &s);

/**
 * @brief 截断过长的字符串
 * @param s 被截断的字符串
 * @param limit 最多保留的字节数
 */
std::string truncate_text(const std::string &s, std::size_t limit);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace pocketjudge
