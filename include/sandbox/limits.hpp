#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>
#include "common/status.hpp"

namespace verifier {

/**
 * @brief 一次沙箱命令的资源限制
 */
struct sandbox_limits {
    /**
     * @brief 沙箱的 cgroup 名称，为空时不使用 cgroup
     */
    std::string cgroup_name;

    int64_t memory_limit_bytes = -1;

    /**
     * @brief 可使用的 CPU 核数，可以是小数，通过 cfs 配额实现
     */
    double cpu_cores = 0;

    /**
     * @brief CPU 时间限制（秒），软限制触发 SIGXCPU，硬限制再多一秒
     */
    int cpu_time_limit = 0;

    int64_t file_limit_bytes = -1;

    int nproc = 0;
};

/**
 * @brief cgroup 统计的资源使用
 */
struct cgroup_usage {
    double peak_memory_mb = 0;
    int64_t cpu_time_ms = 0;
    bool oom = false;
};

/**
 * @brief 创建 cgroup，添加 memory、cpu、cpuacct 控制器并写入限制
 * @throw cgroup_exception 若创建失败
 */
void cgroup_create(const sandbox_limits &);

/**
 * @brief 将进程移入沙箱的 cgroup
 */
void cgroup_attach(const sandbox_limits &, pid_t pid);

/**
 * @brief 读取 cgroup 的峰值内存、CPU 时间以及是否发生了 OOM
 */
cgroup_usage cgroup_summarize(const sandbox_limits &);

/**
 * @brief 杀死 cgroup 内的所有进程
 * 确保受测程序 fork 出来、脱离了进程组的子进程也不会留驻系统
 */
void cgroup_kill(const sandbox_limits &);

void cgroup_delete(const sandbox_limits &);

/**
 * @brief 在子进程中设置 rlimit
 * 只调用系统调用，可以在 fork 之后、exec 之前使用。
 * 不使用 cgroup 时，内存通过 RLIMIT_AS 限制。
 * @return 0 表示成功，否则为 errno
 */
int set_rlimits(const sandbox_limits &limits, bool use_cgroup) noexcept;

/**
 * @brief 预先构造好的 seccomp 过滤器
 * 在父进程中构造，在子进程 exec 之前加载。
 */
struct seccomp_filter {
    seccomp_filter();
    seccomp_filter(seccomp_filter &&other) noexcept;
    seccomp_filter(const seccomp_filter &) = delete;
    ~seccomp_filter();

    bool empty() const;

    /**
     * @brief 加载过滤器，需要先设置 no_new_privs 或者拥有 CAP_SYS_ADMIN
     * @return 0 表示成功，否则为负的 errno
     */
    int load() const noexcept;

private:
    friend seccomp_filter build_seccomp_filter(seccomp_profile profile, bool block_inet);
    void *ctx;
};

/**
 * @brief 根据 seccomp 配置构造过滤器
 * default：杀死调用内核管理类系统调用（mount、reboot、模块加载、交换分区、时钟设置等）的进程
 * strict：在 default 之上禁止 ptrace、命名空间操作、bpf、密钥环等系统调用
 * unconfined：不安装过滤器
 * @param block_inet 为真时 socket(AF_INET/AF_INET6) 返回 EACCES
 * @throw sandbox_error 若 libseccomp 无法构造过滤器
 */
seccomp_filter build_seccomp_filter(seccomp_profile profile, bool block_inet);

}  // namespace verifier
