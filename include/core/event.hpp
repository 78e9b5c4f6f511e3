/**
 * @file event.hpp
 * @brief 中心事件循环的事件类型
 *
 * 所有异步来源（终端输入、远端推送、定时节拍、图片转换结果）
 * 都被统一为 Event，通过一个 EventQueue 交给中心循环串行处理。
 * 生产者只投递事件，从不直接修改视图状态。
 */

#pragma once

#include "model/entities.hpp"
#include "base/safe_queue.hpp"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace paneltalk {

// =============================================================================
// 用户输入
// =============================================================================

/**
 * @brief 终端驱动解码后的按键
 *
 * 无法识别或不支持的按键统一映射为 Other，被调度器忽略。
 */
enum class Key {
    Tab,
    Up,
    Down,
    PageUp,
    PageDown,
    Home,
    End,
    Enter,
    Esc,
    CtrlQ,
    Other
};

struct UserInput {
    Key key = Key::Other;
};

/**
 * @brief 终端尺寸变化：两个面板可容纳的行数
 */
struct Resize {
    size_t leftRows = 0;
    size_t rightRows = 0;
};

// =============================================================================
// 远端推送
// =============================================================================

struct FolderChanged {
    FolderEntity folder;
};

struct FolderRemoved {
    FolderId folderId = 0;
};

struct ChatChanged {
    ChatEntity chat;
};

struct ChatRemoved {
    ChatId chatId = 0;
};

struct MessageUpsert {
    ChatId chatId = 0;
    MessageEntity message;
};

struct MessageDeleted {
    ChatId chatId = 0;
    MessageId messageId = 0;
};

struct TypingChanged {
    ChatId chatId = 0;
    std::string user;
    bool active = false;
};

using RemoteUpdate = std::variant<
    FolderChanged,
    FolderRemoved,
    ChatChanged,
    ChatRemoved,
    MessageUpsert,
    MessageDeleted,
    TypingChanged>;

/**
 * @brief 启动时的全量快照，只投递一次，先于任何增量更新
 */
struct InitialSnapshot {
    std::vector<FolderEntity> folders;
    std::vector<ChatEntity> chats;
    std::vector<MessageUpsert> messages;
};

/**
 * @brief 会话适配器不可恢复的错误，触发退出
 */
struct SessionFailure {
    std::string reason;
};

// =============================================================================
// 内部事件
// =============================================================================

/// 周期性节拍（打字指示动画、相对时间刷新、图片重试）
struct Tick {};

/// 后台图片转换完成，回填缓存
struct ImageReady {
    MessageKey key;
    std::string payloadId;
    std::vector<std::string> grid;
};

using Event = std::variant<
    UserInput,
    Resize,
    RemoteUpdate,
    InitialSnapshot,
    SessionFailure,
    Tick,
    ImageReady>;

using EventQueue = SafeQueue<Event>;

// =============================================================================
// 发往会话适配器的动作
// =============================================================================

/// 用户滚动到已加载消息顶部附近，请求更早的历史
struct FetchMore {
    ChatId chatId = 0;
    MessageId beforeMessageId = 0;

    bool operator==(const FetchMore& o) const {
        return chatId == o.chatId && beforeMessageId == o.beforeMessageId;
    }
};

/// 消息在聚焦面板中可见，标记已读（含之前的消息）
struct MarkRead {
    ChatId chatId = 0;
    MessageId messageId = 0;

    bool operator==(const MarkRead& o) const {
        return chatId == o.chatId && messageId == o.messageId;
    }
};

using OutboundAction = std::variant<FetchMore, MarkRead>;

} // namespace paneltalk
