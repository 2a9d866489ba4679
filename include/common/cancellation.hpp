#pragma once

#include <atomic>
#include <memory>

namespace verifier {

/**
 * @brief 取消令牌，在请求方、编排器和沙箱执行器之间共享
 * 复制得到的令牌共享同一个取消状态。
 * 通过 child() 得到的令牌会跟随父令牌一起取消，但取消子令牌不会影响父令牌，
 * 编排器用它在阶段超时时只终止正在执行的沙箱调用。
 */
struct cancellation_token {
    cancellation_token();

    /**
     * @brief 请求取消，可以从任意线程调用
     */
    void cancel() const;

    bool is_cancelled() const;

    cancellation_token child() const;

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<state> parent;
    };

    explicit cancellation_token(std::shared_ptr<state> s);

    std::shared_ptr<state> s;
};

}  // namespace verifier
