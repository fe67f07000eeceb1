#pragma once

#include <filesystem>
#include <string>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace pocketjudge::test {

/**
 * @brief 测试用的临时文件夹，析构时删除
 */
struct temp_directory {
    temp_directory()
        : path(std::filesystem::temp_directory_path() / ("pocketjudge-test-" + random_uuid())) {
        std::filesystem::create_directories(path);
    }

    ~temp_directory() {
        remove_directory_quietly(path);
    }

    temp_directory(const temp_directory &) = delete;

    const std::filesystem::path path;
};

/**
 * @brief 写入一个可执行的 shell 脚本
 */
inline std::filesystem::path write_script(const std::filesystem::path &dir, const std::string &name, const std::string &body) {
    std::filesystem::path script = dir / name;
    write_file_content(script, "#!/bin/sh\n" + body);
    std::filesystem::permissions(script,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::replace);
    return script;
}

/**
 * @brief 测试环境中不一定有静态链接的 libc，因此不使用 -static
 */
inline toolchain_config make_test_toolchain(const std::filesystem::path &work_dir) {
    toolchain_config config;
    config.compile_command = "g++ -std=c++17 -O2 {source} -o {output}";
    config.spj_compile_command = "g++ -std=c++17 -O2 {source} -o {output}";
    config.work_dir = work_dir;
    return config;
}

/**
 * @brief 把 shell 脚本当作源代码的工具链
 * 编译命令只是把源代码复制为可执行文件，用于不依赖 g++ 的测试
 */
inline toolchain_config make_script_toolchain(const std::filesystem::path &work_dir) {
    std::filesystem::path compiler = write_script(work_dir, "copy-compiler.sh", "cp \"$1\" \"$2\" && chmod +x \"$2\"\n");
    toolchain_config config;
    config.compile_command = compiler.string() + " {source} {output}";
    config.spj_compile_command = config.compile_command;
    config.work_dir = work_dir;
    config.source_name = "main.sh";
    return config;
}

}  // namespace pocketjudge::test
