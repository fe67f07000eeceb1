#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

compiled_artifact::compiled_artifact(const fs::path &work_dir)
    : workdir(fs::absolute(work_dir) / ("submission-" + random_uuid())) {
    fs::create_directories(workdir / "compile");
}

compiled_artifact::compiled_artifact(compiled_artifact &&other) noexcept
    : workdir(move(other.workdir)) {
    other.workdir.clear();
}

compiled_artifact &compiled_artifact::operator=(compiled_artifact &&other) noexcept {
    if (this != &other) {
        if (!workdir.empty()) remove_directory_quietly(workdir);
        workdir = move(other.workdir);
        other.workdir.clear();
    }
    return *this;
}

compiled_artifact::~compiled_artifact() {
    if (!workdir.empty()) remove_directory_quietly(workdir);
}

const fs::path &compiled_artifact::get_workdir() const {
    return workdir;
}

fs::path compiled_artifact::get_compile_dir() const {
    return workdir / "compile";
}

fs::path compiled_artifact::get_executable() const {
    return workdir / "compile" / "main";
}

fs::path compiled_artifact::create_run_dir() const {
    fs::path rundir = workdir / ("run-" + random_uuid());
    fs::create_directories(rundir);
    return rundir;
}

compiler::compiler(string command_template, const toolchain_config &config, shared_ptr<const resource_limiter> limiter)
    : command_template(move(command_template)), config(config), limiter(move(limiter)) {}

vector<string> compiler::build_command(const string &command_template, const fs::path &source, const fs::path &output) {
    vector<string> command = split_whitespace(command_template);
    if (command.empty())
        throw invalid_argument("compile command cannot be empty");
    for (auto &arg : command) {
        boost::replace_all(arg, "{source}", source.string());
        boost::replace_all(arg, "{src}", source.string());
        boost::replace_all(arg, "{output}", output.string());
        boost::replace_all(arg, "{out}", output.string());
    }
    return command;
}

compiled_artifact compiler::compile(const string &source, uint32_t timeout_s, compile_result &result) const {
    result = compile_result();
    compiled_artifact artifact(config.work_dir);
    fs::path compiledir = artifact.get_compile_dir();
    fs::path source_path = compiledir / assert_safe_path(config.source_name);
    fs::path output_path = compiledir / "compile.out";
    write_file_content(source_path, source);

    run_options options;
    options.command = build_command(command_template, source_path, artifact.get_executable());
    options.work_dir = compiledir;
    options.stdout_file = output_path;
    options.stderr_file = output_path;
    options.time_limit_ms = timeout_s * 1000;
    options.memory_limit_mb = 0;
    options.file_limit_bytes = config.output_limit_kb * 1024;

    LOG(INFO) << "Compiling " << source_path << " with " << options.command[0];
    execution_result run = limiter->execute(options);

    result.time_ms = run.time_ms;
    result.output = read_file_prefix(output_path, config.compile_output_limit);

    if (run.timed_out) {
        string message = fmt::format("Compilation timed out after {} seconds", timeout_s);
        result.output = result.output.empty() ? message : result.output + "\n" + message;
        throw compilation_error(message, result.output);
    }
    if (run.crashed) {
        if (result.output.empty())
            result.output = fmt::format("Compiler exited with code {}", run.exit_code);
        throw compilation_error("compilation failed", result.output);
    }
    if (!fs::exists(artifact.get_executable()))
        throw compilation_error("compiler did not produce an executable", result.output);

    result.success = true;
    return artifact;
}

}  // namespace pocketjudge
