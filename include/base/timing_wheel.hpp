/**
 * @file timing_wheel.hpp
 * @brief 时间轮定时器
 *
 * 由定时线程按固定间隔调用 tick() 驱动，用于产生周期性渲染节拍。
 */

#pragma once

#include <vector>
#include <list>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <climits>
#include <atomic>
#include <cstdint>

namespace paneltalk {

using TimerTask = std::function<void()>;
using TimerTaskId = uint64_t;

/// 无效的定时任务 ID
constexpr TimerTaskId INVALID_TIMER_ID = 0;

/**
 * @class TimingWheel
 * @brief 周期任务的单层时间轮
 *
 * 间隔超过一圈的任务用 laps 记录剩余圈数。
 * 任务回调在锁外执行，回调内部可以再次 schedule/cancel。
 *
 * @par 使用示例
 * @code
 * TimingWheel wheel(64, 50);   // 64 槽，每槽 50ms
 * wheel.add_periodic_task(250, [&] { queue.enqueue(Tick{}); });
 * // 定时线程
 * while (running) { sleep(50ms); wheel.tick(); }
 * @endcode
 */
class TimingWheel {
public:
    TimingWheel(int wheel_size, int tick_interval_ms)
        : wheel_size_(wheel_size > 0 ? wheel_size : 1),
          tick_interval_ms_(tick_interval_ms > 0 ? tick_interval_ms : 1),
          slots_(static_cast<size_t>(wheel_size_)) {}

    /**
     * @brief 添加周期任务
     * @return 任务 ID，参数非法时为 INVALID_TIMER_ID
     */
    TimerTaskId add_periodic_task(int interval_ms, TimerTask task) {
        if (interval_ms <= 0 || interval_ms > INT_MAX / 2 || !task) {
            return INVALID_TIMER_ID;
        }

        auto node = std::make_shared<Node>();
        node->ticks = (interval_ms + tick_interval_ms_ - 1) / tick_interval_ms_;
        node->task = std::move(task);

        std::lock_guard<std::mutex> lock(mutex_);
        node->id = next_id_++;
        place(node);
        nodes_[node->id] = node;
        return node->id;
    }

    /**
     * @brief 取消任务
     *
     * 只做标记，节点在所在槽位下次被扫描时清理。
     */
    void cancel_task(TimerTaskId id) {
        if (id == INVALID_TIMER_ID) return;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(id);
        if (it != nodes_.end()) {
            it->second->cancelled = true;
            nodes_.erase(it);
        }
    }

    /// 仍在等待执行的任务数
    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.size();
    }

    int tick_interval_ms() const { return tick_interval_ms_; }

    /**
     * @brief 指针前进一格，执行到期任务
     */
    void tick() {
        std::vector<std::shared_ptr<Node>> due;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            cursor_ = (cursor_ + 1) % wheel_size_;
            auto& slot = slots_[static_cast<size_t>(cursor_)];

            for (auto it = slot.begin(); it != slot.end(); ) {
                auto node = *it;
                if (node->cancelled) {
                    it = slot.erase(it);
                    continue;
                }
                if (node->laps > 0) {
                    --node->laps;
                    ++it;
                    continue;
                }
                due.push_back(node);
                it = slot.erase(it);
            }

            for (auto& node : due) {
                place(node);
            }
        }

        for (auto& node : due) {
            if (!node->cancelled && node->task) {
                node->task();
            }
        }
    }

private:
    struct Node {
        TimerTaskId id = INVALID_TIMER_ID;
        int ticks = 1;        ///< 间隔（tick 数）
        int laps = 0;         ///< 剩余圈数
        std::atomic<bool> cancelled{false};   ///< tick() 在锁外读取
        TimerTask task;
    };

    // 调用方持有 mutex_
    void place(const std::shared_ptr<Node>& node) {
        node->laps = (node->ticks - 1) / wheel_size_;
        int target = (cursor_ + node->ticks) % wheel_size_;
        slots_[static_cast<size_t>(target)].push_back(node);
    }

    const int wheel_size_;
    const int tick_interval_ms_;
    int cursor_ = 0;

    std::vector<std::list<std::shared_ptr<Node>>> slots_;
    std::unordered_map<TimerTaskId, std::shared_ptr<Node>> nodes_;
    TimerTaskId next_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace paneltalk
