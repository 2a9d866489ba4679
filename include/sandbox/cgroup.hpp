#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>
#include "common/exceptions.hpp"

struct cgroup;
struct cgroup_controller;

namespace verifier {

/**
 * @brief libcgroup 调用失败
 * 沙箱无法建立资源隔离，属于协作方不可用的错误
 */
struct cgroup_exception : public sandbox_error {
    cgroup_exception(const std::string &cgroup_op, int err);

    static void ensure(const std::string &cgroup_op, int err);
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 沙箱使用的 controller 有：
 * 1. cpu - 通过 cfs_quota_us / cfs_period_us 限制可以使用的 CPU 核数（可以是小数）
 * 2. cpuacct - 统计沙箱内所有进程的 CPU 时间
 * 3. memory - 限制沙箱内所有进程的内存使用，并统计峰值内存
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;

    /**
     * @brief 析构函数，调用 libcgroup 的释放函数
     */
    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup
     * 这里将 add_controller 函数、add_value 函数添加的数据也写入内核中。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得指定的 controller
     * 必须是 add_controller 已添加过的或者根据 get_cgroup 从内核中获得的已有的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * 将进程 pid 移入本 cgroup
     */
    void attach_task(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup。
     * 所有的进程都会被移入上一层的 cgroup。所有的子 cgroup 都会被删除。
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};

}  // namespace verifier
