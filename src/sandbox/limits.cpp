#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <math.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <errno.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "sandbox/cgroup.hpp"

namespace verifier {
using namespace std;

static const int64_t CFS_PERIOD_US = 100000;

void cgroup_create(const sandbox_limits &limits) {
    cgroup_guard::init();
    cgroup_guard cg(limits.cgroup_name);

    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
    cgroup_ctrl memory = cg.add_controller("memory");
    if (limits.memory_limit_bytes > 0) {
        memory.add_value("memory.limit_in_bytes", limits.memory_limit_bytes);
        memory.add_value("memory.memsw.limit_in_bytes", limits.memory_limit_bytes);
    }

    cgroup_ctrl cpu = cg.add_controller("cpu");
    if (limits.cpu_cores > 0) {
        cpu.add_value("cpu.cfs_period_us", CFS_PERIOD_US);
        cpu.add_value("cpu.cfs_quota_us", (int64_t)ceil(limits.cpu_cores * CFS_PERIOD_US));
    }

    // 统计沙箱内所有进程的 CPU 时间
    cg.add_controller("cpuacct");

    cg.create_cgroup(1);
}

void cgroup_attach(const sandbox_limits &limits, pid_t pid) {
    cgroup_guard cg(limits.cgroup_name);
    cg.get_cgroup();
    cg.attach_task(pid);
}

cgroup_usage cgroup_summarize(const sandbox_limits &limits) {
    cgroup_usage usage;
    cgroup_guard guard(limits.cgroup_name);
    guard.get_cgroup();  // prepare for get_controller

    {
        cgroup_ctrl ctrl = guard.get_controller("memory");
        int64_t max_usage = ctrl.get_value_int64("memory.max_usage_in_bytes");
        usage.peak_memory_mb = (double)max_usage / (1024 * 1024);
    }
    {
        cgroup_ctrl ctrl = guard.get_controller("cpuacct");
        int64_t cpu_time = ctrl.get_value_int64("cpuacct.usage");  // in ns
        usage.cpu_time_ms = cpu_time / 1000000;
    }
    {
        ifstream fin("/sys/fs/cgroup/memory" + limits.cgroup_name + "/memory.oom_control");
        while (fin.good()) {
            string token;
            fin >> token;
            if (token == "oom_kill") {
                int64_t kills = 0;
                fin >> kills;
                usage.oom = kills > 0;
            }
        }
    }
    return usage;
}

void cgroup_kill(const sandbox_limits &limits) {
    void *ptr = nullptr;
    pid_t pid;

    while (true) {
        int ret = cgroup_get_task_begin(limits.cgroup_name.c_str(), "memory", &ptr, &pid);
        cgroup_get_task_end(&ptr);
        if (ret != 0)
            break;
        kill(pid, SIGKILL);
    }
}

void cgroup_delete(const sandbox_limits &limits) {
    cgroup_guard cg(limits.cgroup_name);
    cg.add_controller("cpuacct");
    cg.add_controller("cpu");
    cg.add_controller("memory");
    cg.delete_cgroup();
}

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) != 0 ? errno : 0;
}

int set_rlimits(const sandbox_limits &limits, bool use_cgroup) noexcept {
    int err;

    if (limits.cpu_time_limit > 0) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. */
        rlim_t cputime_limit = (rlim_t)limits.cpu_time_limit;
        if ((err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1))) return err;
    }

    // 使用 cgroup 时内存由 cgroup 限制
    if (!use_cgroup && limits.memory_limit_bytes > 0) {
        if ((err = set_rlimit(RLIMIT_AS, limits.memory_limit_bytes, limits.memory_limit_bytes))) return err;
    }

    if (limits.file_limit_bytes > 0)
        if ((err = set_rlimit(RLIMIT_FSIZE, limits.file_limit_bytes, limits.file_limit_bytes))) return err;
    if (limits.nproc > 0)
        if ((err = set_rlimit(RLIMIT_NPROC, limits.nproc, limits.nproc))) return err;
    return set_rlimit(RLIMIT_CORE, 0, 0);
}

seccomp_filter::seccomp_filter() : ctx(nullptr) {}

seccomp_filter::seccomp_filter(seccomp_filter &&other) noexcept : ctx(other.ctx) {
    other.ctx = nullptr;
}

seccomp_filter::~seccomp_filter() {
    if (ctx) seccomp_release(ctx);
}

bool seccomp_filter::empty() const {
    return ctx == nullptr;
}

int seccomp_filter::load() const noexcept {
    if (!ctx) return 0;
    return seccomp_load(ctx);
}

// clang-format off
static const char *const ADMIN_SYSCALLS[] = {
    "mount", "umount", "umount2", "pivot_root", "reboot",
    "kexec_load", "kexec_file_load",
    "init_module", "finit_module", "delete_module",
    "swapon", "swapoff", "acct",
    "settimeofday", "clock_settime", "clock_adjtime", "adjtimex",
    "sethostname", "setdomainname", "quotactl", "iopl", "ioperm"
};

static const char *const STRICT_SYSCALLS[] = {
    "ptrace", "process_vm_readv", "process_vm_writev",
    "unshare", "setns", "chroot",
    "bpf", "perf_event_open", "userfaultfd", "open_by_handle_at",
    "keyctl", "add_key", "request_key"
};
// clang-format on

template <size_t N>
static void kill_on(scmp_filter_ctx ctx, const char *const (&names)[N]) {
    for (const char *name : names) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR) continue;  // 当前架构上不存在该系统调用
        int rc = seccomp_rule_add(ctx, SCMP_ACT_KILL_PROCESS, nr, 0);
        if (rc < 0 && rc != -EDOM)
            throw sandbox_error(fmt::format("seccomp_rule_add({}): {}", name, strerror(-rc)));
    }
}

seccomp_filter build_seccomp_filter(seccomp_profile profile, bool block_inet) {
    seccomp_filter filter;
    if (profile == seccomp_profile::UNCONFINED) return filter;

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw sandbox_error("seccomp_init failed");
    filter.ctx = ctx;

    kill_on(ctx, ADMIN_SYSCALLS);
    if (profile == seccomp_profile::STRICT)
        kill_on(ctx, STRICT_SYSCALLS);

    if (block_inet) {
        for (int domain : {AF_INET, AF_INET6}) {
            int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                      SCMP_A0(SCMP_CMP_EQ, (scmp_datum_t)domain));
            if (rc < 0)
                throw sandbox_error(fmt::format("seccomp_rule_add(socket): {}", strerror(-rc)));
        }
    }
    return filter;
}

}  // namespace verifier
