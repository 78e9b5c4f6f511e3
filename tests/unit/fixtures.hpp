/**
 * @file fixtures.hpp
 * @brief 单元测试共用的实体构造函数
 */

#pragma once

#include "model/entities.hpp"
#include "core/event.hpp"
#include <string>
#include <vector>

namespace paneltalk::test {

inline FolderEntity makeFolder(FolderId id, const std::string& name,
                               std::vector<ChatId> chats, int position = 0) {
    FolderEntity folder;
    folder.id = id;
    folder.name = name;
    folder.chatIds = std::move(chats);
    folder.position = position == 0 ? static_cast<int>(id) : position;
    return folder;
}

inline ChatEntity makeChat(ChatId id, const std::string& name, int64_t lastActivity = 0,
                           int unread = 0) {
    ChatEntity chat;
    chat.id = id;
    chat.name = name;
    chat.lastActivity = lastActivity;
    chat.unreadCount = unread;
    return chat;
}

inline MessageEntity makeMessage(MessageId id, int64_t timestamp, const std::string& text,
                                 bool read = true, const std::string& sender = "Alice") {
    MessageEntity m;
    m.id = id;
    m.timestamp = timestamp;
    m.text = text;
    m.read = read;
    m.sender = sender;
    return m;
}

inline ImageRef makeImage(const std::string& payloadId, std::vector<uint8_t> bytes) {
    ImageRef ref;
    ref.payloadId = payloadId;
    ref.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    return ref;
}

} // namespace paneltalk::test
