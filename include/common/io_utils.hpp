#pragma once

#include <filesystem>
#include <string>

namespace pocketjudge {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(按字节读取，没有指定编码)
 * @throw internal_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * 用于读取选手程序的 stderr、编译器输出等可能非常大的文件
 * @param path 文件路径，文件不存在时返回空串
 * @param limit 最多读取的字节数
 * @param truncated 若不为空，保存文件是否比 limit 更长
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit, bool *truncated = nullptr);

/**
 * @brief 将 content 写入文件，已经存在的文件将被覆盖
 * @throw internal_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，
 * 如果拿到的文件名包含 "../" 或者是绝对路径，那么最后有可能导致工作目录外的文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 删除文件夹，失败时只记录日志
 * 用于析构函数等不能抛出异常的场合
 */
void remove_directory_quietly(const std::filesystem::path &dir) noexcept;

}  // namespace pocketjudge
