#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace codebox {

/**
 * @brief 并发队列，写者读者模型
 * 队列关闭后不再接受新元素，读者取完剩余元素后 pop 返回 false
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列中最多保存的元素个数，队列已满时 push 阻塞；为 0 时不限制
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @param element 保存队头元素
     * @return 若队列已关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) not_empty.wait(mlock);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时阻塞等待直到有空位或者队列被关闭为止
     * @return 若队列已关闭，返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        while (capacity > 0 && q.size() >= capacity && !closed) not_full.wait(mlock);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者和写者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        not_empty.notify_all();
        not_full.notify_all();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::size_t capacity;
    bool closed = false;
};

}  // namespace codebox
