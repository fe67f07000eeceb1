#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace pocketjudge {

struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是工作目录无法读写、配置不一致等问题，最终会被映射为 Judge Error
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法启动子进程
 * 比如可执行文件不存在、没有执行权限、execvp 失败。
 * 这类错误是评测系统的问题，必须和选手程序的运行时错误区分开。
 */
struct spawn_error : public judge_exception {
    explicit spawn_error(const std::string &message);
};

/**
 * @brief 表示程序编译失败
 * 包括编译器返回非零值和编译超时，error_log 为编译器的输出（已截断）
 */
struct compilation_error : public judge_exception {
    const std::string error_log;

    compilation_error(const std::string &what, const std::string &error_log);
};

}  // namespace pocketjudge
