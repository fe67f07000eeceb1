#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pocketjudge {

/**
 * @brief 默认的编译命令模板
 * {source} 和 {output} 会在按空白切分之后被替换为源文件和可执行文件路径
 */
extern const char *DEFAULT_COMPILE_COMMAND;

/**
 * @brief 默认的 special judge 编译命令模板
 */
extern const char *DEFAULT_SPJ_COMPILE_COMMAND;

/**
 * @brief 评测工具链的配置
 * 所有的配置项都是可选的，从 toolchain.json 读入
 */
struct toolchain_config {
    /**
     * @brief 编译选手程序的命令模板
     */
    std::string compile_command = DEFAULT_COMPILE_COMMAND;

    /**
     * @brief 编译 special judge 源代码的命令模板
     */
    std::string spj_compile_command = DEFAULT_SPJ_COMPILE_COMMAND;

    /**
     * @brief 编译器输出最多保留的字节数
     */
    std::size_t compile_output_limit = 65536;

    /**
     * @brief 选手程序 stderr、special judge 消息最多保留的字节数
     */
    std::size_t diagnostic_limit = 4096;

    /**
     * @brief 选手程序最多能写入的文件大小(KB)，超出后会收到 SIGXFSZ
     */
    std::uint64_t output_limit_kb = 65536;

    std::uint32_t spj_time_limit_ms = 5000;

    std::uint32_t spj_memory_limit_mb = 256;

    /**
     * @brief 存放编译产物和运行目录的文件夹
     * 每个提交都会在这里创建一个 submission-<uuid> 文件夹
     */
    std::filesystem::path work_dir = std::filesystem::temp_directory_path() / "pocketjudge";

    /**
     * @brief 选手源代码保存的文件名
     */
    std::string source_name = "main.cpp";
};

void from_json(const nlohmann::json &j, toolchain_config &config);

/**
 * @brief 从 json 文件中读取工具链配置
 * @throw std::invalid_argument 配置文件格式错误
 * @throw internal_error 配置文件无法读取
 */
toolchain_config load_toolchain_config(const std::filesystem::path &path);

}  // namespace pocketjudge
