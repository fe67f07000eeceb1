#include "config.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace pocketjudge {
using namespace std;
using namespace nlohmann;

const char *DEFAULT_COMPILE_COMMAND = "g++ -std=c++17 -O2 -static -s {source} -o {output}";
const char *DEFAULT_SPJ_COMPILE_COMMAND = "g++ -std=c++17 -O2 {source} -o {output}";

// 编译命令模板必须同时引用源文件和可执行文件
static void assert_compile_template(const string &key, const string &command) {
    if (command.find("{source}") == string::npos && command.find("{src}") == string::npos)
        throw invalid_argument(fmt::format("{} \"{}\" does not reference {{source}}", key, command));
    if (command.find("{output}") == string::npos && command.find("{out}") == string::npos)
        throw invalid_argument(fmt::format("{} \"{}\" does not reference {{output}}", key, command));
}

void from_json(const json &j, toolchain_config &config) {
    if (!j.is_object())
        throw invalid_argument("toolchain configuration must be a json object");

    assign_optional(j, config.compile_command, "compile_command");
    assign_optional(j, config.spj_compile_command, "spj_compile_command");
    assign_optional(j, config.compile_output_limit, "compile_output_limit");
    assign_optional(j, config.diagnostic_limit, "diagnostic_limit");
    assign_optional(j, config.output_limit_kb, "output_limit_kb");
    assign_optional(j, config.spj_time_limit_ms, "spj_time_limit_ms");
    assign_optional(j, config.spj_memory_limit_mb, "spj_memory_limit_mb");
    if (j.count("work_dir"))
        config.work_dir = j.at("work_dir").get<string>();
    assign_optional(j, config.source_name, "source_name");

    assert_safe_path(config.source_name);
    assert_compile_template("compile_command", config.compile_command);
    assert_compile_template("spj_compile_command", config.spj_compile_command);
    if (config.spj_time_limit_ms == 0)
        throw invalid_argument("spj_time_limit_ms must be positive");
}

toolchain_config load_toolchain_config(const filesystem::path &path) {
    toolchain_config config;
    try {
        json j = json::parse(read_file_content(path));
        j.get_to(config);
    } catch (json::exception &e) {
        throw invalid_argument(fmt::format("malformed toolchain configuration {}: {}", path.string(), e.what()));
    }
    return config;
}

}  // namespace pocketjudge
