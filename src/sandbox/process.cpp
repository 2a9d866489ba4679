#include "sandbox/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <linux/capability.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

/**
 * @brief 子进程通过 close-on-exec 管道报告的配置结果
 * exec 成功时管道被关闭，父进程读到 EOF
 */
struct child_report {
    int fatal;
    int err;
    char what[120];
};

/**
 * @brief fork 之前准备好的子进程参数，子进程中不再分配内存
 */
struct child_context {
    const process_options *opt;
    const seccomp_filter *filter;
    vector<char *> argv;
    vector<char *> envp;
    vector<string> env_storage;
    vector<string> mount_points;
    int pipefd[3][2];
    int go_pipe[2];
    int report_pipe[2];
};

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

/**
 * @brief 读取当前挂载命名空间的所有挂载点
 * /proc/self/mountinfo 的第 5 列是挂载点，空白字符被转义为 \040 之类的八进制
 */
static vector<string> read_mount_points() {
    vector<string> result;
    ifstream fin("/proc/self/mountinfo");
    string line;
    while (getline(fin, line)) {
        istringstream ss(line);
        string field, mount_point;
        for (int i = 0; i < 5 && ss >> field; ++i)
            if (i == 4) mount_point = field;
        if (mount_point.empty()) continue;

        string decoded;
        for (size_t i = 0; i < mount_point.size(); ++i) {
            if (mount_point[i] == '\\' && i + 3 < mount_point.size()) {
                decoded.push_back((char)stoi(mount_point.substr(i + 1, 3), nullptr, 8));
                i += 3;
            } else {
                decoded.push_back(mount_point[i]);
            }
        }
        result.push_back(decoded);
    }
    return result;
}

static bool is_under(const string &path, const string &dir) {
    if (path == dir) return true;
    if (dir == "/") return true;
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

static void child_report_message(int fd, bool fatal, int err, const char *what) noexcept {
    child_report report;
    memset(&report, 0, sizeof(report));
    report.fatal = fatal;
    report.err = err;
    strncpy(report.what, what, sizeof(report.what) - 1);
    ssize_t ignored = write(fd, &report, sizeof(report));
    (void)ignored;
}

[[noreturn]] static void child_fail(const child_context &ctx, int err, const char *what) noexcept {
    child_report_message(ctx.report_pipe[PIPE_IN], true, err, what);
    _exit(E_SANDBOX_SETUP);
}

/**
 * @brief 隔离措施失败：强制隔离时终止，否则只报告警告
 */
static void child_isolation_failed(const child_context &ctx, int err, const char *what) noexcept {
    if (ctx.opt->require_isolation)
        child_fail(ctx, err, what);
    child_report_message(ctx.report_pipe[PIPE_IN], false, err, what);
}

static unsigned long carried_mount_flags(const char *mount_point) noexcept {
    struct statvfs st;
    if (statvfs(mount_point, &st) != 0) return 0;
    unsigned long flags = 0;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

static void child_make_read_only(const child_context &ctx) noexcept {
    const char *work_dir = ctx.opt->work_dir.c_str();

    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        child_isolation_failed(ctx, errno, "making mounts private");
        return;
    }

    // 工作路径单独绑定挂载，这样它的上层挂载点变为只读后它仍然可写
    if (mount(work_dir, work_dir, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
        child_isolation_failed(ctx, errno, "bind mounting scratch directory");
        return;
    }

    for (auto &mount_point : ctx.mount_points) {
        const char *mp = mount_point.c_str();
        unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY | carried_mount_flags(mp);
        if (mount(nullptr, mp, nullptr, flags, nullptr) != 0) {
            if (mount_point == "/")
                child_isolation_failed(ctx, errno, "remounting / read-only");
            else
                child_report_message(ctx.report_pipe[PIPE_IN], false, errno, "remounting a mount point read-only");
        }
    }
}

static void child_drop_capabilities(const child_context &ctx) noexcept {
    if (geteuid() != 0) return;

    for (int cap = 0;; ++cap) {
        if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0) {
            if (errno == EINVAL) break;  // 超过了内核支持的最大 capability
            child_fail(ctx, errno, "dropping capability bounding set");
        }
    }

    struct __user_cap_header_struct header;
    struct __user_cap_data_struct data[2];
    memset(&header, 0, sizeof(header));
    memset(data, 0, sizeof(data));
    header.version = _LINUX_CAPABILITY_VERSION_3;
    header.pid = 0;
    if (syscall(SYS_capset, &header, data) != 0)
        child_fail(ctx, errno, "clearing capabilities");
}

[[noreturn]] static void child_main(const child_context &ctx) noexcept {
    const process_options &opt = *ctx.opt;

    // 在独立的进程组中运行命令，这样可以通过一个信号杀死命令及其所有子进程
    if (setsid() == -1) child_fail(ctx, errno, "setsid");

    for (int i = 1; i <= 2; ++i) {
        if (dup2(ctx.pipefd[i][PIPE_IN], i) < 0) child_fail(ctx, errno, "redirecting output");
        close(ctx.pipefd[i][PIPE_IN]);
        close(ctx.pipefd[i][PIPE_OUT]);
    }
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail(ctx, errno, "redirecting stdin");
    close(devnull);

    // 等待父进程将子进程移入 cgroup
    close(ctx.go_pipe[PIPE_IN]);
    char go;
    if (read(ctx.go_pipe[PIPE_OUT], &go, 1) != 1) _exit(E_SANDBOX_SETUP);
    close(ctx.go_pipe[PIPE_OUT]);

    if (chdir(opt.work_dir.c_str()) != 0) child_fail(ctx, errno, "changing to scratch directory");

    int err = set_rlimits(opt.limits, opt.use_cgroup);
    if (err) child_fail(ctx, err, "setting resource limits");

    int flags = 0;
    if (opt.isolate_network) flags |= CLONE_NEWNET;
    if (opt.read_only_filesystem) flags |= CLONE_NEWNS;
    bool isolated = true;
    if (flags && unshare(flags) != 0) {
        // 非特权用户可以通过新的用户命名空间获得创建其他命名空间的权限
        if (errno != EPERM || unshare(flags | CLONE_NEWUSER) != 0) {
            isolated = false;
            child_isolation_failed(ctx, errno, "unsharing network and mount namespaces");
        }
    }

    if (isolated && opt.read_only_filesystem)
        child_make_read_only(ctx);

    if (opt.drop_capabilities) child_drop_capabilities(ctx);

    if (opt.no_new_privileges && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0)
        child_fail(ctx, errno, "setting no_new_privs");

    if (!ctx.filter->empty()) {
        int rc = ctx.filter->load();
        if (rc < 0) child_isolation_failed(ctx, -rc, "loading seccomp filter");
    }

    execve(ctx.argv[0], ctx.argv.data(), ctx.envp.data());
    child_fail(ctx, errno, "unable to start command");
}

static void terminate_group(pid_t pid) {
    /* First try to kill graciously, then hard.
	   Don't report an already exited process as error. */
    DLOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "sending SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    DLOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "sending SIGKILL to process group " << pid << ": " << strerror(errno);
}

struct output_collector {
    output_collector(process_result &result, output_budget &budget)
        : result(result), budget(budget) {}

    void consume(int fd, const char *data, size_t n) {
        size_t keep = min(n, budget.remaining);
        budget.remaining -= keep;
        budget.dropped += n - keep;

        log_stream stream = fd == STDOUT_FILENO ? log_stream::STDOUT : log_stream::STDERR;
        string &buffer = stream == log_stream::STDOUT ? result.stdout_data : result.stderr_data;
        buffer.append(data, keep);

        string &line = partial[fd];
        for (size_t i = 0; i < keep; ++i) {
            if (data[i] == '\n') {
                result.logs.push_back({current_time_millis(), stream, move(line)});
                line.clear();
            } else {
                line.push_back(data[i]);
            }
        }
    }

    void flush() {
        for (int fd = 1; fd <= 2; ++fd) {
            if (partial[fd].empty()) continue;
            log_stream stream = fd == STDOUT_FILENO ? log_stream::STDOUT : log_stream::STDERR;
            result.logs.push_back({current_time_millis(), stream, move(partial[fd])});
            partial[fd].clear();
        }
    }

private:
    process_result &result;
    output_budget &budget;
    string partial[3];
};

/**
 * @brief 读出管道中的所有可读数据
 * @return false 若管道已经到达 EOF 并被关闭
 */
static bool pump_pipe(int &fd, int stream, output_collector &collector) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            collector.consume(stream, buf, nread);
            continue;
        }
        if (nread == 0) {
            close(fd);
            fd = -1;
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "copying data fd {}", stream);
    }
}

static vector<child_report> read_child_reports(int fd) {
    vector<child_report> reports;
    child_report report;
    while (true) {
        ssize_t nread = read(fd, &report, sizeof(report));
        if (nread == (ssize_t)sizeof(report)) {
            report.what[sizeof(report.what) - 1] = '\0';
            reports.push_back(report);
        } else if (nread < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return reports;
}

process_result run_guarded(const process_options &opt,
                           const seccomp_filter &filter,
                           output_budget &budget,
                           const cancellation_token &token) {
    if (opt.argv.empty()) throw internal_error("empty command");

    process_result result;
    output_collector collector(result, budget);

    child_context ctx;
    ctx.opt = &opt;
    ctx.filter = &filter;
    for (auto &arg : opt.argv) ctx.argv.push_back(const_cast<char *>(arg.c_str()));
    ctx.argv.push_back(nullptr);
    for (auto &[key, value] : opt.env) ctx.env_storage.push_back(key + "=" + value);
    for (auto &entry : ctx.env_storage) ctx.envp.push_back(entry.data());
    ctx.envp.push_back(nullptr);

    if (opt.read_only_filesystem) {
        string work_dir = opt.work_dir.string();
        for (auto &mount_point : read_mount_points()) {
            // 伪文件系统需要保持原样，/dev/null 等设备必须可写
            if (is_under(mount_point, "/proc") || is_under(mount_point, "/sys") || is_under(mount_point, "/dev"))
                continue;
            if (is_under(mount_point, work_dir)) continue;
            ctx.mount_points.push_back(mount_point);
        }
    }

    for (int i = 0; i <= 2; ++i)
        ctx.pipefd[i][0] = ctx.pipefd[i][1] = -1;
    ctx.go_pipe[0] = ctx.go_pipe[1] = ctx.report_pipe[0] = ctx.report_pipe[1] = -1;
    defer {
        for (int i = 1; i <= 2; ++i)
            for (int j = 0; j < 2; ++j)
                if (ctx.pipefd[i][j] >= 0) close(ctx.pipefd[i][j]);
        for (int fd : {ctx.go_pipe[0], ctx.go_pipe[1], ctx.report_pipe[0], ctx.report_pipe[1]})
            if (fd >= 0) close(fd);
    };

    for (int i = 1; i <= 2; ++i)
        if (pipe2(ctx.pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    if (pipe2(ctx.go_pipe, O_CLOEXEC) != 0) error(errno, "creating synchronization pipe");
    if (pipe2(ctx.report_pipe, O_CLOEXEC) != 0) error(errno, "creating report pipe");

    if (opt.use_cgroup) cgroup_create(opt.limits);
    defer {
        if (!opt.use_cgroup) return;
        cgroup_kill(opt.limits);
        cgroup_delete(opt.limits);
    };

    elapsed_time wall;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            throw sandbox_error(fmt::format("unable to fork: {}", strerror(errno)));
        case 0:
            child_main(ctx);
        default:
            break;
    }

    for (int i = 1; i <= 2; ++i) {
        close(ctx.pipefd[i][PIPE_IN]);
        ctx.pipefd[i][PIPE_IN] = -1;
    }
    close(ctx.go_pipe[PIPE_OUT]);
    ctx.go_pipe[PIPE_OUT] = -1;
    close(ctx.report_pipe[PIPE_IN]);
    ctx.report_pipe[PIPE_IN] = -1;

    auto abandon_child = [&] {
        kill(-child_pid, SIGKILL);
        kill(child_pid, SIGKILL);
        waitpid(child_pid, nullptr, 0);
    };

    if (opt.use_cgroup) {
        try {
            cgroup_attach(opt.limits, child_pid);
        } catch (...) {
            abandon_child();
            throw;
        }
    }

    if (write(ctx.go_pipe[PIPE_IN], "g", 1) != 1) {
        int err = errno;
        abandon_child();
        error(err, "releasing sandbox child");
    }
    close(ctx.go_pipe[PIPE_IN]);
    ctx.go_pipe[PIPE_IN] = -1;

    for (auto &report : read_child_reports(ctx.report_pipe[PIPE_OUT])) {
        string message = fmt::format("{}: {}", report.what, strerror(report.err));
        if (report.fatal) {
            abandon_child();
            throw sandbox_error("sandbox setup failed, " + message);
        }
        LOG(WARNING) << "sandbox isolation degraded, " << message;
        result.warnings.push_back(message);
    }

    for (int i = 1; i <= 2; ++i) {
        int flags = fcntl(ctx.pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(ctx.pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1) {
            int err = errno;
            abandon_child();
            error(err, "fcntl, setting flags");
        }
    }

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    bool exited = false, killed = false;
    while (!exited) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int i = 1; i <= 2; ++i)
            if (ctx.pipefd[i][PIPE_OUT] >= 0)
                fds[nfds++] = {ctx.pipefd[i][PIPE_OUT], POLLIN, 0};

        if (nfds > 0) {
            if (poll(fds, nfds, 50) == -1 && errno != EINTR) error(errno, "waiting for child data");
        } else {
            nanosleep(&killdelay, nullptr);
        }

        for (int i = 1; i <= 2; ++i)
            if (ctx.pipefd[i][PIPE_OUT] >= 0)
                pump_pipe(ctx.pipefd[i][PIPE_OUT], i, collector);

        pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
        if (pid == -1 && errno != EINTR) error(errno, "waiting on child");
        if (pid == child_pid) {
            exited = true;
            break;
        }

        if (killed) continue;
        if (chrono::steady_clock::now() >= opt.deadline) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            result.timed_out = true;
            killed = true;
            terminate_group(child_pid);
        } else if (token.is_cancelled()) {
            LOG(WARNING) << "sandbox execution cancelled: aborting command";
            result.cancelled = true;
            killed = true;
            terminate_group(child_pid);
        }
    }

    // 命令已经结束，杀死进程组内残留的后台进程，以便管道到达 EOF
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill remaining processes: " << strerror(errno);
    if (opt.use_cgroup) cgroup_kill(opt.limits);

    // 脱离了进程组的进程可能一直持有管道，最多再等待 0.2 秒
    elapsed_time drain;
    while ((ctx.pipefd[1][PIPE_OUT] >= 0 || ctx.pipefd[2][PIPE_OUT] >= 0) &&
           drain.duration<chrono::milliseconds>().count() < 200) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int i = 1; i <= 2; ++i)
            if (ctx.pipefd[i][PIPE_OUT] >= 0)
                fds[nfds++] = {ctx.pipefd[i][PIPE_OUT], POLLIN, 0};
        if (poll(fds, nfds, 20) == -1 && errno != EINTR) break;
        for (int i = 1; i <= 2; ++i)
            if (ctx.pipefd[i][PIPE_OUT] >= 0)
                pump_pipe(ctx.pipefd[i][PIPE_OUT], i, collector);
    }
    collector.flush();

    result.wall_time_ms = wall.duration<chrono::milliseconds>().count();

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.term_signal = WTERMSIG(status);
        result.exit_code = result.term_signal + 128;
        switch (result.term_signal) {
            case SIGXCPU:
                result.timed_out = true;
                LOG(WARNING) << "Time Limit Exceeded (hard cpu limit)";
                break;
            default:
                LOG(WARNING) << "Command terminated with signal (" << result.term_signal << ", " << strsignal(result.term_signal) << ")";
                break;
        }
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    if (opt.use_cgroup) {
        cgroup_usage cg = cgroup_summarize(opt.limits);
        result.peak_memory_mb = cg.peak_memory_mb;
        result.cpu_time_ms = cg.cpu_time_ms;
        result.oom = cg.oom;
    } else {
        result.peak_memory_mb = (double)usage.ru_maxrss / 1024;  // ru_maxrss in KB
        result.cpu_time_ms = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
                             (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
    }

    LOG(INFO) << fmt::format("command finished: exit {}, real {}ms, cpu {}ms, memory {:.1f}MB",
                             result.exit_code, result.wall_time_ms, result.cpu_time_ms, result.peak_memory_mb);
    return result;
}

}  // namespace verifier
