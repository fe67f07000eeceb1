#include "sandbox/rlimit_limiter.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

// 两次 wait4 之间的间隔
const useconds_t POLL_INTERVAL_US = 2000;

// 子进程在 exec 之前失败的阶段，和 errno 一起传回父进程
enum child_stage : int {
    STAGE_SETPGID = 1,
    STAGE_REDIRECT = 2,
    STAGE_CHDIR = 3,
    STAGE_RLIMIT = 4,
    STAGE_SYNC = 5,
    STAGE_EXEC = 6
};

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_SETPGID: return "setpgid";
        case STAGE_REDIRECT: return "redirecting standard streams";
        case STAGE_CHDIR: return "changing working directory";
        case STAGE_RLIMIT: return "setting resource limits";
        case STAGE_SYNC: return "waiting for watchdog";
        case STAGE_EXEC: return "execve";
        default: return "unknown stage";
    }
}

template <typename... Args>
static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        if (close(fd) != 0)
            LOG(WARNING) << "unable to close fd " << fd << ": " << strerror(errno);
        fd = -1;
    }
}

/**
 * @brief 向子进程写入错误信息并退出，只能调用异步信号安全的函数
 */
[[noreturn]] static void child_fail(int fd, int stage) {
    int message[2] = {stage, errno};
    ssize_t ret = write(fd, message, sizeof(message));
    (void)ret;
    _exit(127);
}

struct rlimit_entry {
    int resource;
    struct rlimit limit;
};

uint64_t read_peak_rss_kb(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/status");
    string line;
    while (getline(fin, line)) {
        if (boost::starts_with(line, "VmHWM:")) {
            vector<string> parts;
            boost::split(parts, line, boost::is_any_of(" \t"), boost::token_compress_on);
            if (parts.size() >= 2) {
                try {
                    return boost::lexical_cast<uint64_t>(parts[1]);
                } catch (boost::bad_lexical_cast &) {
                    return 0;
                }
            }
        }
    }
    return 0;
}

string find_executable(const string &command) {
    if (command.find('/') != string::npos)
        return command;

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / command;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate))
            return candidate.string();
    }
    return "";
}

process_monitor::~process_monitor() {}

/**
 * @brief 默认的监控器，通过进程组杀死进程，通过 /proc 采样内存
 */
struct process_group_monitor : public process_monitor {
    void attach(pid_t) override {}

    uint64_t sample_memory_kb(pid_t pid) override {
        return read_peak_rss_kb(pid);
    }

    void kill_all(pid_t pid) override {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    }

    void finish(pid_t pid, execution_result &) override {
        // 进程组中可能还有进程在运行，比如选手程序 fork 出来的子进程
        kill_all(pid);
    }
};

unique_ptr<process_monitor> rlimit_limiter::create_monitor(const run_options &) const {
    return make_unique<process_group_monitor>();
}

string rlimit_limiter::name() const {
    return "rlimit";
}

execution_result rlimit_limiter::execute(const run_options &opt) const {
    if (opt.command.empty())
        throw invalid_argument("command cannot be empty");

    string executable = find_executable(opt.command[0]);
    if (executable.empty() || access(executable.c_str(), F_OK) != 0)
        throw spawn_error(fmt::format("unable to start {}: no such file", opt.command[0]));

    // fork 之后子进程只能调用异步信号安全的函数，因此所有的准备工作都在 fork 之前完成
    vector<string> args = opt.command;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int stdin_fd = -1, stdout_fd = -1, stderr_fd = -1;
    int sync_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        close_fd(stdin_fd);
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        for (int i = 0; i < 2; ++i) {
            close_fd(sync_pipe[i]);
            close_fd(error_pipe[i]);
        }
    };

    {
        string stdin_path = opt.stdin_file.empty() ? "/dev/null" : opt.stdin_file.string();
        stdin_fd = open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (stdin_fd < 0) error(errno, "opening file '{}'", stdin_path);

        string stdout_path = opt.stdout_file.empty() ? "/dev/null" : opt.stdout_file.string();
        stdout_fd = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (stdout_fd < 0) error(errno, "opening file '{}'", stdout_path);

        if (!opt.stderr_file.empty() && opt.stderr_file != opt.stdout_file) {
            stderr_fd = open(opt.stderr_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
            if (stderr_fd < 0) error(errno, "opening file '{}'", opt.stderr_file.string());
        } else if (opt.stderr_file.empty()) {
            stderr_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
            if (stderr_fd < 0) error(errno, "opening /dev/null");
        }
    }

    if (pipe2(sync_pipe, O_CLOEXEC) != 0) error(errno, "creating sync pipe");
    if (pipe2(error_pipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    vector<rlimit_entry> limits;
    {
        // 在软限制处内核发送 SIGXCPU，在硬限制处发送 SIGKILL，
        // 因此收到 SIGXCPU 一定说明 CPU 时间超限
        rlim_t cputime_limit = (rlim_t)ceil(opt.time_limit_ms / 1000.0) + 1;
        limits.push_back({RLIMIT_CPU, {cputime_limit, cputime_limit + 1}});
        limits.push_back({RLIMIT_CORE, {0, 0}});
        if (opt.file_limit_bytes > 0)
            limits.push_back({RLIMIT_FSIZE, {(rlim_t)opt.file_limit_bytes, (rlim_t)opt.file_limit_bytes}});
        if (opt.memory_limit_mb > 0) {
            rlim_t memory_bytes = (rlim_t)opt.memory_limit_mb << 20;
            limits.push_back({RLIMIT_STACK, {memory_bytes, memory_bytes}});
        }
    }

    unique_ptr<process_monitor> monitor = create_monitor(opt);
    string work_dir = opt.work_dir.string();

    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");

    if (pid == 0) {
        int fail_fd = error_pipe[PIPE_WRITE];
        if (setpgid(0, 0) != 0) child_fail(fail_fd, STAGE_SETPGID);

        if (dup2(stdin_fd, STDIN_FILENO) < 0) child_fail(fail_fd, STAGE_REDIRECT);
        if (dup2(stdout_fd, STDOUT_FILENO) < 0) child_fail(fail_fd, STAGE_REDIRECT);
        if (stderr_fd >= 0) {
            if (dup2(stderr_fd, STDERR_FILENO) < 0) child_fail(fail_fd, STAGE_REDIRECT);
        } else {
            if (dup2(STDOUT_FILENO, STDERR_FILENO) < 0) child_fail(fail_fd, STAGE_REDIRECT);
        }

        if (!work_dir.empty() && chdir(work_dir.c_str()) != 0) child_fail(fail_fd, STAGE_CHDIR);

        for (auto &entry : limits)
            if (setrlimit(entry.resource, &entry.limit) != 0) child_fail(fail_fd, STAGE_RLIMIT);

        // 等待父进程完成 attach（比如移入 cgroup）
        char go;
        if (read(sync_pipe[PIPE_READ], &go, 1) != 1) child_fail(fail_fd, STAGE_SYNC);

        execve(executable.c_str(), argv.data(), environ);
        child_fail(fail_fd, STAGE_EXEC);
    }

    // 父进程
    bool reaped = false;
    defer {
        // 发生异常时确保子进程不会残留
        if (!reaped) {
            monitor->kill_all(pid);
            waitpid(pid, nullptr, 0);
        }
    };

    // 子进程自己也会调用 setpgid，这里再调用一次以避免竞争
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "unable to set process group of " << pid << ": " << strerror(errno);

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
    close_fd(sync_pipe[PIPE_READ]);
    close_fd(error_pipe[PIPE_WRITE]);

    monitor->attach(pid);

    {
        char go = 1;
        if (write(sync_pipe[PIPE_WRITE], &go, 1) != 1)
            error(errno, "signalling child {}", pid);
        close_fd(sync_pipe[PIPE_WRITE]);
    }

    {
        // exec 成功时管道因为 O_CLOEXEC 被关闭，read 返回 0
        int message[2];
        ssize_t nread;
        do {
            nread = read(error_pipe[PIPE_READ], message, sizeof(message));
        } while (nread < 0 && errno == EINTR);
        if (nread < 0) error(errno, "reading error pipe of child {}", pid);
        if (nread == sizeof(message)) {
            waitpid(pid, nullptr, 0);
            reaped = true;
            throw spawn_error(fmt::format("unable to start {}: {}: {}", opt.command[0], stage_name(message[0]), strerror(message[1])));
        }
    }

    execution_result result;
    elapsed_time timer;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    uint64_t memory_limit_kb = (uint64_t)opt.memory_limit_mb * 1024;

    while (true) {
        pid_t ret = wait4(pid, &status, WNOHANG, &usage);
        if (ret == pid) break;
        if (ret < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting on child {}", pid);
        }

        result.memory_kb = max(result.memory_kb, monitor->sample_memory_kb(pid));

        bool kill_child = false;
        if (memory_limit_kb > 0 && result.memory_kb > memory_limit_kb) {
            result.memory_exceeded = true;
            kill_child = true;
            LOG(WARNING) << "Memory Limit Exceeded (" << result.memory_kb << "KB): killing process group " << pid;
        } else if (timer.milliseconds() >= opt.time_limit_ms) {
            result.timed_out = true;
            kill_child = true;
            LOG(WARNING) << "Time Limit Exceeded (wall time): killing process group " << pid;
        }

        if (kill_child) {
            monitor->kill_all(pid);
            while (wait4(pid, &status, 0, &usage) < 0) {
                if (errno != EINTR) error(errno, "waiting on child {}", pid);
            }
            break;
        }

        usleep(POLL_INTERVAL_US);
    }
    reaped = true;

    result.time_ms = timer.milliseconds();
    if (result.timed_out)
        result.time_ms = max(result.time_ms, (double)opt.time_limit_ms);
    result.cpu_time_ms = usage.ru_utime.tv_sec * 1000.0 + usage.ru_utime.tv_usec / 1000.0 +
                         usage.ru_stime.tv_sec * 1000.0 + usage.ru_stime.tv_usec / 1000.0;
    // ru_maxrss 单位为 KB
    result.memory_kb = max(result.memory_kb, (uint64_t)usage.ru_maxrss);

    monitor->finish(pid, result);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
        if (result.signal == SIGXCPU) {
            result.timed_out = true;
            result.time_ms = max(result.time_ms, (double)opt.time_limit_ms);
            LOG(WARNING) << "Time Limit Exceeded (cpu time)";
        } else if (result.signal == SIGXFSZ) {
            result.output_truncated = true;
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }
    result.crashed = result.exit_code != 0;

    if (memory_limit_kb > 0 && result.memory_kb > memory_limit_kb)
        result.memory_exceeded = true;

    DLOG(INFO) << fmt::format("{} finished: exitcode {}, time {:.3f}ms, cpu {:.3f}ms, memory {}KB",
                              opt.command[0], result.exit_code, result.time_ms, result.cpu_time_ms, result.memory_kb);
    return result;
}

}  // namespace pocketjudge
