/**
 * @file thread_pool.hpp
 * @brief 后台任务线程池
 *
 * 用于把耗时操作（图片转字符画等）移出中心循环线程。
 * 任务结果通过 std::future 返回，调用方可以按时间预算等待。
 */

#pragma once

#include <vector>
#include <thread>
#include <memory>
#include <functional>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <atomic>

#include <blockingconcurrentqueue.h>

namespace paneltalk {

/**
 * @class ThreadPool
 * @brief 每个工作线程一个独立任务队列的线程池
 *
 * @par 设计特点
 * - 每个线程独立的无锁任务队列（moodycamel::BlockingConcurrentQueue）
 * - 轮询分配任务
 * - 优雅关闭：发送空任务通知线程退出
 *
 * @par 使用示例
 * @code
 * ThreadPool pool(1);
 * auto future = pool.enqueue([&] { return converter.convert(bytes, 40); });
 * if (future.wait_for(std::chrono::milliseconds(30)) == std::future_status::ready) {
 *     grid = future.get();
 * }
 * @endcode
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t threads);

    /**
     * @brief 析构线程池
     *
     * 已入队的任务会先执行完，然后线程退出。
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务（轮询分配）
     * @return std::future 用于获取任务返回值
     * @throws std::runtime_error 线程池已停止
     */
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    size_t get_thread_count() const { return thread_count_; }

private:
    using TaskQueue = moodycamel::BlockingConcurrentQueue<std::function<void()>>;

    std::vector<std::thread> workers_;
    std::vector<std::unique_ptr<TaskQueue>> task_queues_;
    std::atomic<bool> stop_;
    std::atomic<size_t> next_thread_;
    size_t thread_count_;
};

// --- 实现 ---

inline ThreadPool::ThreadPool(size_t threads)
    : stop_(false), next_thread_(0), thread_count_(threads == 0 ? 1 : threads) {
    for (size_t i = 0; i < thread_count_; ++i) {
        task_queues_.push_back(std::make_unique<TaskQueue>());
    }

    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this, i] {
            auto& my_queue = *task_queues_[i];
            while (true) {
                std::function<void()> task;
                my_queue.wait_dequeue(task);
                if (!task) break;  // 空任务表示退出
                task();
            }
        });
    }
}

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {

    using return_type = std::invoke_result_t<F, Args...>;

    if (stop_) {
        throw std::runtime_error("enqueue on stopped ThreadPool");
    }

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> res = task->get_future();

    size_t thread_index = next_thread_.fetch_add(1) % thread_count_;
    task_queues_[thread_index]->enqueue([task]() { (*task)(); });

    return res;
}

inline ThreadPool::~ThreadPool() {
    stop_ = true;
    for (size_t i = 0; i < thread_count_; ++i) {
        task_queues_[i]->enqueue(nullptr);
    }
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace paneltalk
