/**
 * @file entities.hpp
 * @brief 文件夹 / 会话 / 消息实体定义
 *
 * 这些实体由会话适配器产生，经对账器（Reconciler）合并进视图状态仓库。
 * 只有仓库持有实体的权威副本。
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <functional>

namespace paneltalk {

using FolderId = int64_t;
using ChatId = int64_t;
using MessageId = int64_t;

/// "全部会话" 伪文件夹的 ID（服务端文件夹 ID 均非 0）
constexpr FolderId ALL_CHATS_FOLDER_ID = 0;

/**
 * @brief 文件夹
 *
 * chatIds 的顺序即显示顺序。
 */
struct FolderEntity {
    FolderId id = 0;
    std::string name;
    std::vector<ChatId> chatIds;
    int unreadCount = 0;
    int position = 0;           ///< 服务端排序键，决定文件夹显示顺序
};

/**
 * @brief 会话
 *
 * messageIds 为已加载消息，按时间先后排列，由仓库维护；
 * 来自远端的 ChatEntity 只携带元数据（名称、预览、未读数、活跃时间）。
 */
struct ChatEntity {
    ChatId id = 0;
    std::string name;
    std::string lastPreview;
    int unreadCount = 0;
    int64_t lastActivity = 0;   ///< 最近活跃时间（epoch 秒）
    std::vector<MessageId> messageIds;

    std::string typingUser;     ///< 正在输入的用户，空表示无
    int64_t typingUntilMs = 0;  ///< 输入状态过期时间（steady_clock 毫秒）
};

/**
 * @brief 图片负载引用
 *
 * 字节内容只读共享，多个快照/转换任务可同时持有。
 */
struct ImageRef {
    std::string payloadId;
    std::shared_ptr<const std::vector<uint8_t>> bytes;
};

/**
 * @brief 消息
 *
 * 除 text/image/read/edited/deleted 外的字段创建后不再变化。
 */
struct MessageEntity {
    MessageId id = 0;
    std::string sender;
    int64_t timestamp = 0;      ///< epoch 秒
    std::string text;
    std::optional<ImageRef> image;
    bool read = false;
    bool edited = false;
    bool deleted = false;       ///< 墓碑标记
};

/**
 * @brief 消息在全局范围内的唯一键（消息 ID 仅在会话内唯一）
 */
struct MessageKey {
    ChatId chatId = 0;
    MessageId messageId = 0;

    bool operator==(const MessageKey& other) const {
        return chatId == other.chatId && messageId == other.messageId;
    }
    bool operator!=(const MessageKey& other) const { return !(*this == other); }
    bool operator<(const MessageKey& other) const {
        return chatId != other.chatId ? chatId < other.chatId : messageId < other.messageId;
    }
};

struct MessageKeyHash {
    size_t operator()(const MessageKey& key) const {
        size_t h1 = std::hash<int64_t>{}(key.chatId);
        size_t h2 = std::hash<int64_t>{}(key.messageId);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

/// 两个 MessageEntity 的可见内容是否完全一致
inline bool sameContent(const MessageEntity& a, const MessageEntity& b) {
    const std::string pa = a.image ? a.image->payloadId : std::string();
    const std::string pb = b.image ? b.image->payloadId : std::string();
    return a.id == b.id && a.sender == b.sender && a.timestamp == b.timestamp &&
           a.text == b.text && pa == pb && a.read == b.read &&
           a.edited == b.edited && a.deleted == b.deleted;
}

} // namespace paneltalk
