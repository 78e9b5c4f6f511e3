/**
 * @file reconciler.cpp
 * @brief Reconciler 实现
 */

#include "state/reconciler.hpp"
#include "base/logger.hpp"
#include <algorithm>

namespace paneltalk {

Reconciler::Reconciler(ViewStateStore& store, ErrorCounters& errors, ReconcilerOptions options)
    : store_(store)
    , errors_(errors)
    , options_(options) {}

bool Reconciler::apply(const RemoteUpdate& update, int64_t nowMs) {
    const uint64_t before = store_.version();

    if (auto* u = std::get_if<FolderChanged>(&update)) {
        onFolderChanged(*u);
    } else if (auto* u = std::get_if<FolderRemoved>(&update)) {
        onFolderRemoved(*u);
    } else if (auto* u = std::get_if<ChatChanged>(&update)) {
        onChatChanged(*u);
    } else if (auto* u = std::get_if<ChatRemoved>(&update)) {
        onChatRemoved(*u);
    } else if (auto* u = std::get_if<MessageUpsert>(&update)) {
        onMessageUpsert(*u);
    } else if (auto* u = std::get_if<MessageDeleted>(&update)) {
        onMessageDeleted(*u);
    } else if (auto* u = std::get_if<TypingChanged>(&update)) {
        onTypingChanged(*u, nowMs);
    }

    return store_.version() != before;
}

bool Reconciler::applySnapshot(const InitialSnapshot& snapshot) {
    const uint64_t before = store_.version();

    for (const auto& chat : snapshot.chats) {
        store_.upsertChat(chat);
    }
    for (const auto& folder : snapshot.folders) {
        store_.upsertFolder(folder);
    }
    for (const auto& m : snapshot.messages) {
        resolveChat(m.chatId, "snapshot message");
        store_.upsertMessage(m.chatId, m.message);
    }

    LOG() << "[Reconciler] Initial snapshot: " << snapshot.folders.size() << " folders, "
          << snapshot.chats.size() << " chats, " << snapshot.messages.size() << " messages";
    return store_.version() != before;
}

bool Reconciler::onTick(int64_t nowMs) {
    return store_.clearExpiredTyping(nowMs) > 0;
}

std::vector<OutboundAction> Reconciler::syncVisibility() {
    std::vector<OutboundAction> actions;

    const auto& right = store_.panel(Pane::Right);
    if (right.content.kind != ContentKind::MessageList) {
        return actions;
    }
    const ChatId chatId = right.content.id;

    store_.compact(chatId);

    // compact 之后重新读取面板状态
    const auto& panel = store_.panel(Pane::Right);
    const auto seq = store_.sequence(Pane::Right);
    if (seq.empty()) {
        return actions;
    }

    if (panel.focused) {
        const size_t end = std::min(seq.size(), panel.scrollOffset + store_.visibleCount(Pane::Right));
        std::optional<MessageId> newestUnread;
        for (size_t i = panel.scrollOffset; i < end; ++i) {
            const auto* m = store_.findMessage(chatId, seq[i]);
            if (m && !m->read) {
                newestUnread = seq[i];
            }
        }
        if (newestUnread) {
            store_.markRead(chatId, *newestUnread);
            actions.push_back(MarkRead{chatId, *newestUnread});
        }
    }

    if (panel.cursor && *panel.cursor < options_.fetchMoreThreshold) {
        const MessageId oldest = seq.front();
        auto it = requestedBefore_.find(chatId);
        if (it == requestedBefore_.end() || it->second != oldest) {
            requestedBefore_[chatId] = oldest;
            actions.push_back(FetchMore{chatId, oldest});
        }
    }
    return actions;
}

// =============================================================================
// 各类更新
// =============================================================================

bool Reconciler::onFolderChanged(const FolderChanged& update) {
    for (ChatId chatId : update.folder.chatIds) {
        if (!store_.findChat(chatId)) {
            errors_.record(ErrorKind::UnknownUpdateEntity);
            LOG() << "[Reconciler] " << toString(ErrorKind::UnknownUpdateEntity)
                  << ": folder " << update.folder.id << " lists unknown chat " << chatId;
        }
    }
    return store_.upsertFolder(update.folder);
}

bool Reconciler::onFolderRemoved(const FolderRemoved& update) {
    if (!store_.removeFolder(update.folderId)) {
        errors_.record(ErrorKind::UnknownUpdateEntity);
        LOG() << "[Reconciler] " << toString(ErrorKind::UnknownUpdateEntity)
              << ": remove of unknown folder " << update.folderId;
        return false;
    }
    return true;
}

bool Reconciler::onChatChanged(const ChatChanged& update) {
    return store_.upsertChat(update.chat);
}

bool Reconciler::onChatRemoved(const ChatRemoved& update) {
    requestedBefore_.erase(update.chatId);
    if (!store_.removeChat(update.chatId)) {
        errors_.record(ErrorKind::UnknownUpdateEntity);
        LOG() << "[Reconciler] " << toString(ErrorKind::UnknownUpdateEntity)
              << ": remove of unknown chat " << update.chatId;
        return false;
    }
    return true;
}

bool Reconciler::onMessageUpsert(const MessageUpsert& update) {
    resolveChat(update.chatId, "message upsert");

    const auto result = store_.upsertMessage(update.chatId, update.message);
    if (result == UpsertResult::Unchanged) {
        return false;
    }

    const auto* chat = store_.findChat(update.chatId);
    if (chat && isNewest(update.chatId, update.message.id)) {
        const auto* stored = store_.findMessage(update.chatId, update.message.id);
        int unread = chat->unreadCount;
        if (result == UpsertResult::Inserted && stored && !stored->read && !stored->deleted) {
            ++unread;
        }
        store_.setChatSummary(update.chatId, stored ? previewOf(*stored) : chat->lastPreview, unread);
        if (result == UpsertResult::Inserted) {
            store_.touchChat(update.chatId, update.message.timestamp);
        }
    }

    store_.compact(update.chatId);
    return true;
}

bool Reconciler::onMessageDeleted(const MessageDeleted& update) {
    const auto* m = store_.findMessage(update.chatId, update.messageId);
    if (!m) {
        errors_.record(ErrorKind::UnknownUpdateEntity);
        LOG() << "[Reconciler] " << toString(ErrorKind::UnknownUpdateEntity)
              << ": delete of unknown message " << update.chatId << "/" << update.messageId;
        return false;
    }
    const bool wasUnread = !m->read;
    const bool newest = isNewest(update.chatId, update.messageId);

    if (!store_.markDeleted(update.chatId, update.messageId)) {
        return false;
    }

    if (const auto* chat = store_.findChat(update.chatId)) {
        const int unread = wasUnread ? chat->unreadCount - 1 : chat->unreadCount;
        const std::string preview = newest ? std::string("[message deleted]") : chat->lastPreview;
        store_.setChatSummary(update.chatId, preview, unread);
    }

    store_.compact(update.chatId);
    return true;
}

bool Reconciler::onTypingChanged(const TypingChanged& update, int64_t nowMs) {
    resolveChat(update.chatId, "typing");
    if (update.active) {
        return store_.setTyping(update.chatId, update.user, nowMs + options_.typingTimeoutMs);
    }
    return store_.clearTyping(update.chatId);
}

// =============================================================================
// 工具
// =============================================================================

void Reconciler::resolveChat(ChatId chatId, const char* context) {
    if (store_.findChat(chatId)) {
        return;
    }
    errors_.record(ErrorKind::UnknownUpdateEntity);
    LOG() << "[Reconciler] " << toString(ErrorKind::UnknownUpdateEntity)
          << ": " << context << " for unknown chat " << chatId << ", creating placeholder";
    store_.ensureChat(chatId);
}

bool Reconciler::isNewest(ChatId chatId, MessageId messageId) const {
    const auto* chat = store_.findChat(chatId);
    return chat && !chat->messageIds.empty() && chat->messageIds.back() == messageId;
}

std::string Reconciler::previewOf(const MessageEntity& message) {
    if (message.deleted) {
        return "[message deleted]";
    }
    std::string body = message.text;
    auto newline = body.find('\n');
    if (newline != std::string::npos) {
        body = body.substr(0, newline);
    }
    if (body.empty() && message.image) {
        body = "[image]";
    }
    return message.sender.empty() ? body : message.sender + ": " + body;
}

} // namespace paneltalk
