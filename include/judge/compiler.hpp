#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/result.hpp"
#include "sandbox/resource_limiter.hpp"

namespace pocketjudge {

/**
 * @brief 编译产物，拥有一个提交的工作目录
 * 工作目录的结构：
 *     <work_dir>/submission-<uuid>/
 *         compile/          源代码、可执行文件、编译器输出
 *         run-<uuid>/       每个测试点的运行目录
 * 析构时删除整个工作目录。只能移动，不能复制。
 * 可执行文件在编译后不会再被修改，因此可以被多个 worker 同时读取。
 */
struct compiled_artifact {
    /**
     * @brief 在 work_dir 下创建一个新的工作目录
     * @throw std::filesystem::filesystem_error 无法创建目录
     */
    explicit compiled_artifact(const std::filesystem::path &work_dir);

    compiled_artifact(compiled_artifact &&other) noexcept;
    compiled_artifact &operator=(compiled_artifact &&other) noexcept;
    compiled_artifact(const compiled_artifact &) = delete;
    compiled_artifact &operator=(const compiled_artifact &) = delete;

    ~compiled_artifact();

    const std::filesystem::path &get_workdir() const;

    std::filesystem::path get_compile_dir() const;

    /**
     * @brief 可执行文件的绝对路径
     */
    std::filesystem::path get_executable() const;

    /**
     * @brief 为一次运行创建新的运行目录 run-<uuid>
     */
    std::filesystem::path create_run_dir() const;

private:
    std::filesystem::path workdir;
};

/**
 * @brief 调用编译命令模板编译单个源文件
 * 同一个类既用于编译选手程序，也用于编译 special judge
 */
struct compiler {
    /**
     * @param command_template 编译命令模板，{source} 和 {output}（或 {src} 和 {out}）会被替换
     * @param config 工具链配置，用到了 work_dir、source_name、compile_output_limit、output_limit_kb
     * @param limiter 运行编译器的资源限制器
     */
    compiler(std::string command_template, const toolchain_config &config, std::shared_ptr<const resource_limiter> limiter);

    /**
     * @brief 编译源代码
     * @param source 源代码
     * @param timeout_s 编译时间限制(s)
     * @param result 保存编译器输出、编译时间以及是否成功
     * @return 编译产物
     * @throw compilation_error 编译失败或编译超时
     * @throw spawn_error 无法启动编译器
     */
    compiled_artifact compile(const std::string &source, std::uint32_t timeout_s, compile_result &result) const;

    /**
     * @brief 根据模板生成编译命令
     * 模板先按空白切分再替换，因此源文件路径不会影响编译参数
     */
    static std::vector<std::string> build_command(const std::string &command_template,
                                                  const std::filesystem::path &source,
                                                  const std::filesystem::path &output);

private:
    std::string command_template;
    toolchain_config config;
    std::shared_ptr<const resource_limiter> limiter;
};

}  // namespace pocketjudge
