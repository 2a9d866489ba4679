#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/result.hpp"

namespace verifier {

/**
 * @brief 沙箱内运行一条命令的设置
 */
struct process_options {
    /**
     * @brief 程序路径 (argv[0]) 和参数
     */
    std::vector<std::string> argv;

    /**
     * @brief 工作路径，也是只读文件系统下唯一可写的路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 子进程的全部环境变量，不继承父进程的环境
     */
    std::map<std::string, std::string> env;

    sandbox_limits limits;
    bool use_cgroup = false;

    /**
     * @brief 在新的网络命名空间中运行，没有任何网络设备
     */
    bool isolate_network = true;

    /**
     * @brief 在新的挂载命名空间中将除 work_dir 以外的挂载点重新挂载为只读
     */
    bool read_only_filesystem = true;

    bool no_new_privileges = true;
    bool drop_capabilities = true;

    /**
     * @brief 无法建立命名空间隔离时是否视为错误
     */
    bool require_isolation = true;

    /**
     * @brief 墙钟截止时间，超过后杀死整个进程组
     */
    std::chrono::steady_clock::time_point deadline;
};

/**
 * @brief 同一次沙箱执行中所有命令共享的输出配额
 */
struct output_budget {
    size_t remaining = 0;
    size_t dropped = 0;
};

struct process_result {
    /**
     * @brief 进程返回值，若因信号终止则为 128 + 信号
     */
    int exit_code = -1;

    /**
     * @brief 终止进程的信号，正常退出时为 0
     */
    int term_signal = 0;

    /**
     * @brief 墙钟时间超限或者 CPU 时间超限（SIGXCPU）
     */
    bool timed_out = false;

    bool cancelled = false;

    /**
     * @brief 进程被 cgroup 的 OOM killer 杀死
     */
    bool oom = false;

    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 按行切分的输出，保持到达顺序
     */
    std::vector<execution_log> logs;

    double peak_memory_mb = 0;
    int64_t cpu_time_ms = 0;
    int64_t wall_time_ms = 0;

    /**
     * @brief 未强制要求的隔离措施失败时的警告
     */
    std::vector<std::string> warnings;
};

/**
 * @brief 在受限的子进程中运行命令，并等待其结束
 * 1. 若使用 cgroup，则创建 cgroup 并在 fork 后将子进程移入
 * 2. 调用 fork 创建子进程，子进程：
 *    1. 调用 setsid 分离到独立的进程组，以便通过信号杀死进程组内所有进程
 *    2. 将 stdout/stderr 连接到管道，stdin 连接到 /dev/null
 *    3. 通过 rlimit 限制 CPU 时间、文件大小、进程数（不使用 cgroup 时还有内存）
 *    4. 分离网络命名空间、挂载命名空间，将工作路径以外的挂载点重新挂载为只读
 *    5. 清空 capability、设置 no_new_privs、加载 seccomp 过滤器
 *    6. 以指定的环境变量 exec 命令
 *    配置失败时通过 close-on-exec 的管道将错误报告给父进程
 * 3. 父进程读取子进程输出直到超出配额（之后丢弃并计数），同时检查截止时间与取消令牌，
 *    超时或取消时先发送 SIGTERM，0.1 秒后发送 SIGKILL
 * 4. 子进程结束后杀死进程组（及 cgroup）内残留的进程，统计资源使用
 * 
 * @param filter 预先构造的 seccomp 过滤器，可以为空
 * @param budget 输出配额，会被扣减
 * @param token 取消令牌
 * @throw sandbox_error 若无法创建子进程或强制的隔离措施失败
 */
process_result run_guarded(const process_options &opt,
                           const seccomp_filter &filter,
                           output_budget &budget,
                           const cancellation_token &token);

}  // namespace verifier
