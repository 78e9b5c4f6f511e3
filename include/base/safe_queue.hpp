/**
 * @file safe_queue.hpp
 * @brief 多生产者 / 单消费者阻塞队列
 *
 * 作为全局事件队列使用：输入线程、会话线程、定时线程、图片转换线程
 * 只负责 enqueue，中心循环线程独占 pop。
 */

#pragma once

#include <queue>
#include <mutex>
#include <chrono>
#include <condition_variable>

namespace paneltalk {

/**
 * @class SafeQueue
 * @brief 线程安全的 FIFO 队列，支持停止语义
 *
 * stop() 之后：
 * - enqueue() 不再接收新元素，返回 false
 * - pop() 不再等待，直接返回 false（剩余元素被丢弃，不再消费）
 */
template <typename T>
class SafeQueue {
public:
    SafeQueue() : stop_(false) {}

    SafeQueue(const SafeQueue&) = delete;
    SafeQueue& operator=(const SafeQueue&) = delete;

    /**
     * @brief 入队
     * @return false 队列已停止，元素被丢弃
     */
    bool enqueue(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                return false;
            }
            queue_.push(std::move(value));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * @brief 阻塞出队
     * @return false 队列已停止
     */
    bool pop(T& value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || stop_; });
        if (stop_) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    /**
     * @brief 带超时的出队
     * @return false 超时或队列已停止
     */
    template <typename Rep, typename Period>
    bool pop_for(T& value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || stop_; })) {
            return false;
        }
        if (stop_) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cond_.notify_all();
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool stop_;
};

} // namespace paneltalk
