/**
 * @file session_adapter.hpp
 * @brief 消息会话适配器接口定义
 *
 * 定义消息服务的抽象接口，支持多种会话源（真实服务、模拟等）。
 * 适配器负责：连接服务 -> 接收推送 -> 转换为 RemoteUpdate -> 写入事件队列
 */

#pragma once

#include <string>
#include <functional>
#include "core/event.hpp"

namespace paneltalk {

/**
 * @enum AdapterState
 * @brief 会话适配器状态
 */
enum class AdapterState {
    DISCONNECTED,   ///< 未连接
    CONNECTING,     ///< 连接中
    READY,          ///< 已同步，持续推送增量更新
    FAILED          ///< 不可恢复的错误
};

inline const char* toString(AdapterState state) {
    switch (state) {
        case AdapterState::DISCONNECTED: return "DISCONNECTED";
        case AdapterState::CONNECTING:   return "CONNECTING";
        case AdapterState::READY:        return "READY";
        case AdapterState::FAILED:       return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief 状态变更回调类型
 * @param state 新状态
 * @param message 状态描述信息
 */
using StateCallback = std::function<void(AdapterState state, const std::string& message)>;

/**
 * @class SessionAdapter
 * @brief 会话适配器抽象接口
 *
 * 所有会话源都应实现此接口。适配器的职责：
 * 1. 管理与服务的连接与认证
 * 2. 启动后先投递一次 InitialSnapshot，再投递增量 RemoteUpdate
 * 3. 响应 fetchMore / markRead 请求
 * 4. 不可恢复的错误投递 SessionFailure
 *
 * @par 线程模型
 * - 适配器内部可以有自己的工作线程
 * - 所有数据只通过事件队列交给中心循环，适配器从不接触视图状态
 * - start()/stop()/fetchMore()/markRead() 由中心循环线程调用，不得阻塞
 */
class SessionAdapter {
public:
    virtual ~SessionAdapter() = default;

    // =========================================================================
    // 生命周期管理
    // =========================================================================

    /**
     * @brief 启动适配器
     * @return false 启动失败
     */
    virtual bool start() = 0;

    /**
     * @brief 停止适配器，之后不再投递事件
     */
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
    virtual AdapterState getState() const = 0;

    // =========================================================================
    // 出站请求
    // =========================================================================

    /**
     * @brief 请求某条消息之前的更早历史
     *
     * 结果以 MessageUpsert 的形式异步投递。
     */
    virtual void fetchMore(ChatId chatId, MessageId beforeMessageId) = 0;

    /**
     * @brief 把会话中直到 messageId（含）的消息标记为已读
     */
    virtual void markRead(ChatId chatId, MessageId messageId) = 0;

    // =========================================================================
    // 回调与信息
    // =========================================================================

    virtual void setStateCallback(StateCallback callback) = 0;

    /// 适配器名称（如 "Mock"）
    virtual std::string getName() const = 0;

protected:
    /**
     * @param events 中心循环的事件队列
     */
    explicit SessionAdapter(EventQueue& events)
        : events_(events) {}

    /**
     * @brief 把事件写入队列
     * @return false 队列已停止（中心循环正在退出）
     */
    bool pushEvent(Event event) {
        return events_.enqueue(std::move(event));
    }

    /// 中心循环的事件队列
    EventQueue& events_;
};

} // namespace paneltalk
