/**
 * @file reconciler.hpp
 * @brief 远端更新对账器
 *
 * 把会话适配器推送的 RemoteUpdate 合并进视图状态仓库，
 * 同时维护未读数、预览、活跃时间、输入状态，并在每个事件之后
 * 根据可见性产生 MarkRead / FetchMore 动作。
 */

#pragma once

#include "core/event.hpp"
#include "core/error.hpp"
#include "state/view_state_store.hpp"
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace paneltalk {

struct ReconcilerOptions {
    int64_t typingTimeoutMs = 5000;     ///< 输入状态持续时间
    size_t fetchMoreThreshold = 3;      ///< 光标距顶部小于该行数时请求更早历史
};

/**
 * @class Reconciler
 * @brief 单线程对账器（只在中心循环线程调用）
 *
 * 光标/滚动的修正由仓库在每次变更内部完成（位置保持规则），
 * 对账器负责把远端语义翻译为仓库操作：
 * - 未知会话：隐式创建占位会话，而不是丢弃更新
 * - 新消息：更新预览/未读数，并在 "全部会话" 中前移该会话
 * - 编辑与标记类变更：只改数据，不动光标
 */
class Reconciler {
public:
    Reconciler(ViewStateStore& store, ErrorCounters& errors,
               ReconcilerOptions options = ReconcilerOptions());

    /**
     * @brief 合并一条远端更新
     * @param nowMs steady_clock 毫秒，用于输入状态过期
     * @return true 仓库发生了变化
     */
    bool apply(const RemoteUpdate& update, int64_t nowMs);

    /**
     * @brief 合并启动时的全量快照
     *
     * 快照中的未读数为权威值，消息不再累加未读。
     */
    bool applySnapshot(const InitialSnapshot& snapshot);

    /**
     * @brief 周期节拍：清理过期的输入状态
     */
    bool onTick(int64_t nowMs);

    /**
     * @brief 每个事件处理完之后调用
     *
     * - 压缩消息面板中已滚出视野的墓碑消息
     * - 聚焦的消息面板中可见的未读消息标记为已读，产生 MarkRead
     * - 光标接近已加载消息的顶部时产生 FetchMore（同一起点只请求一次）
     */
    std::vector<OutboundAction> syncVisibility();

private:
    bool onFolderChanged(const FolderChanged& update);
    bool onFolderRemoved(const FolderRemoved& update);
    bool onChatChanged(const ChatChanged& update);
    bool onChatRemoved(const ChatRemoved& update);
    bool onMessageUpsert(const MessageUpsert& update);
    bool onMessageDeleted(const MessageDeleted& update);
    bool onTypingChanged(const TypingChanged& update, int64_t nowMs);

    /// 会话未知时记录 UnknownUpdateEntity 并创建占位会话
    void resolveChat(ChatId chatId, const char* context);

    /// 消息是否为会话中最新的一条
    bool isNewest(ChatId chatId, MessageId messageId) const;

    static std::string previewOf(const MessageEntity& message);

    ViewStateStore& store_;
    ErrorCounters& errors_;
    ReconcilerOptions options_;

    /// 每个会话最近一次 FetchMore 的起点，避免重复请求
    std::unordered_map<ChatId, MessageId> requestedBefore_;
};

} // namespace paneltalk
