#pragma once

#include <atomic>

namespace assessor {

/**
 * @brief 评测的取消标记
 * 调用方（比如面试被放弃时）调用 cancel，正在等待子进程的 process_runner
 * 会在下一次轮询时强制终止子进程，orchestrator 不再启动后续测试点。
 * 同一个标记可以在多个线程之间共享。
 */
struct cancellation_token {
    void cancel() noexcept {
        flag.store(true, std::memory_order_release);
    }

    bool cancelled() const noexcept {
        return flag.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> flag{false};
};

}  // namespace assessor
