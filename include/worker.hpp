#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "verify/orchestrator.hpp"

/**
 * 验证服务相关函数
 * 验证服务持有固定数量的 worker 线程，worker 数量即同时运行的沙箱数量上限。
 *
 * 提交的验证任务先进入队列，每个 worker 从队列中拉取任务并调用编排器完成一次验证，
 * worker 都在忙时任务在队列中等待而不是被拒绝。
 * 验证完成后，通过任务中的回调函数返回报告或者异常。
 */
namespace verifier {

struct verification_job {
    task_schema task;

    /**
     * @brief 取消令牌，任务在队列中等待时被取消也会在开始验证时立刻结束
     */
    cancellation_token token;

    /**
     * @brief 验证正常结束时调用，报告的判定可以是 PASS 或 FAIL
     */
    std::function<void(verification_report report)> on_completed;

    /**
     * @brief 验证没有产生报告时调用，如任务不合法或者验证被取消
     */
    std::function<void(std::exception_ptr error)> on_failed;
};

struct verification_service {
    /**
     * @brief 启动 worker 线程
     * @param orchestrator 所有 worker 共用的编排器，生命周期必须长于验证服务
     * @param workers worker 线程的数量，至少为 1
     */
    verification_service(verification_orchestrator &orchestrator, size_t workers);

    /**
     * @brief 若没有调用过 stop，析构时会调用 stop
     */
    ~verification_service();

    /**
     * @brief 提交一个验证任务
     * @throw internal_error 若验证服务已经停止
     */
    void submit(verification_job job);

    /**
     * @brief 队列中等待 worker 的任务数
     */
    size_t pending() const;

    /**
     * @brief 停止验证服务
     * 调用该函数后不再接受新任务。worker 在队列为空时退出，
     * 因此该函数返回时所有已经提交的任务都已经完成并调用了回调函数。
     */
    void stop();

private:
    void worker_loop(size_t worker_id);

    verification_orchestrator &orchestrator;
    concurrent_queue<verification_job> queue;

    std::mutex submit_mutex;
    std::atomic<bool> stopping{false};
    std::vector<std::thread> threads;
};

}  // namespace verifier
