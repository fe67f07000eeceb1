#include "sandbox/resource_limiter.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "sandbox/cgroup_limiter.hpp"
#include "sandbox/rlimit_limiter.hpp"

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

resource_limiter::~resource_limiter() {}

execution_result resource_limiter::run(const vector<string> &command,
                                       const string &stdin_content,
                                       const run_limits &limits,
                                       const fs::path &run_dir,
                                       const string &name) const {
    run_options options;
    options.command = command;
    options.work_dir = run_dir;
    options.stdin_file = run_dir / (name + ".in");
    options.stdout_file = run_dir / (name + ".out");
    options.stderr_file = run_dir / (name + ".err");
    options.time_limit_ms = limits.time_limit_ms;
    options.memory_limit_mb = limits.memory_limit_mb;
    options.file_limit_bytes = limits.output_limit_kb * 1024;

    write_file_content(options.stdin_file, stdin_content);

    execution_result result = execute(options);
    result.output = read_file_content(options.stdout_file, "");
    result.error_output = read_file_prefix(options.stderr_file, limits.diagnostic_limit);
    if (options.file_limit_bytes > 0 && result.output.size() >= options.file_limit_bytes)
        result.output_truncated = true;
    return result;
}

shared_ptr<resource_limiter> make_resource_limiter(const string &type) {
    if (type == "rlimit") {
        return make_shared<rlimit_limiter>();
    } else if (type == "cgroup") {
        return make_shared<cgroup_limiter>();
    } else {
        throw invalid_argument("unknown sandbox type " + type);
    }
}

}  // namespace pocketjudge
