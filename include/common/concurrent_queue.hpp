#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace assessor {

/**
 * @brief 并发队列，写者读者模型
 * 命令行前端把待评测提交的序号放入队列，工作线程从队列中取出并评测。
 * 写者写完所有元素后调用 close，读者在队列为空且已关闭时退出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @return 队列头元素，队列已关闭且为空时返回 std::nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace assessor
