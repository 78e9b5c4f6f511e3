/**
 * @file view_state_store.cpp
 * @brief ViewStateStore 实现
 */

#include "state/view_state_store.hpp"
#include "base/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace paneltalk {

ViewStateStore::ViewStateStore(StoreOptions options)
    : options_(std::move(options)) {
    const size_t rows = std::max<size_t>(options_.defaultViewportRows, 1);
    rows_ = {rows, rows};

    panels_[0].content = PaneContent::folders();
    panels_[0].focused = true;
    panels_[1].content = PaneContent::empty();
    panels_[1].focused = false;

    ensureCursorVisible(panels_[0], sequence(panels_[0].content).size(), rows_[0]);
}

size_t ViewStateStore::visibleCount(Pane pane) const {
    const size_t i = index(pane);
    const auto seq = sequence(panels_[i].content);
    return viewport(i, seq).fit(panels_[i].scrollOffset, seq.size());
}

// =============================================================================
// 只读访问
// =============================================================================

Pane ViewStateStore::focusedPane() const {
    return panels_[1].focused ? Pane::Right : Pane::Left;
}

NavMode ViewStateStore::mode() const {
    if (focusedPane() == Pane::Right) {
        return NavMode::MessagesPane;
    }
    return panels_[0].content.kind == ContentKind::ChatList ? NavMode::ChatsPane : NavMode::FoldersPane;
}

std::vector<int64_t> ViewStateStore::sequence(Pane pane) const {
    return sequence(panel(pane).content);
}

std::vector<int64_t> ViewStateStore::sequence(const PaneContent& content) const {
    switch (content.kind) {
        case ContentKind::Empty:
            return {};
        case ContentKind::FolderList: {
            std::vector<int64_t> ids;
            ids.reserve(folderOrder_.size() + 1);
            if (options_.showAllChats) {
                ids.push_back(ALL_CHATS_FOLDER_ID);
            }
            ids.insert(ids.end(), folderOrder_.begin(), folderOrder_.end());
            return ids;
        }
        case ContentKind::ChatList: {
            if (content.id == ALL_CHATS_FOLDER_ID && options_.showAllChats) {
                return allChatsOrder_;
            }
            auto it = folders_.find(content.id);
            return it != folders_.end() ? it->second.chatIds : std::vector<int64_t>{};
        }
        case ContentKind::MessageList: {
            auto it = chats_.find(content.id);
            return it != chats_.end() ? it->second.messageIds : std::vector<int64_t>{};
        }
    }
    return {};
}

std::optional<int64_t> ViewStateStore::selectedId(Pane pane) const {
    const auto& ps = panel(pane);
    if (!ps.cursor) {
        return std::nullopt;
    }
    auto seq = sequence(ps.content);
    if (*ps.cursor >= seq.size()) {
        return std::nullopt;
    }
    return seq[*ps.cursor];
}

std::optional<FolderEntity> ViewStateStore::folderInfo(FolderId id) const {
    if (id == ALL_CHATS_FOLDER_ID && options_.showAllChats) {
        FolderEntity all;
        all.id = ALL_CHATS_FOLDER_ID;
        all.name = options_.allChatsTitle;
        all.chatIds = allChatsOrder_;
        for (const auto& [chatId, chat] : chats_) {
            all.unreadCount += chat.unreadCount;
        }
        return all;
    }
    auto it = folders_.find(id);
    if (it == folders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const ChatEntity* ViewStateStore::findChat(ChatId id) const {
    auto it = chats_.find(id);
    return it != chats_.end() ? &it->second : nullptr;
}

const MessageEntity* ViewStateStore::findMessage(ChatId chatId, MessageId messageId) const {
    auto bucket = messages_.find(chatId);
    if (bucket == messages_.end()) {
        return nullptr;
    }
    auto it = bucket->second.find(messageId);
    return it != bucket->second.end() ? &it->second : nullptr;
}

size_t ViewStateStore::messageCount(ChatId chatId) const {
    auto it = chats_.find(chatId);
    return it != chats_.end() ? it->second.messageIds.size() : 0;
}

bool ViewStateStore::invariantsHold() const {
    if (panels_[0].focused == panels_[1].focused) {
        return false;
    }
    for (size_t i = 0; i < panels_.size(); ++i) {
        if (!panelValid(panels_[i], sequence(panels_[i].content).size())) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// 内部工具
// =============================================================================

template <typename Mutator>
void ViewStateStore::reshape(Mutator&& mutate) {
    std::array<PositionAnchor, 2> anchors;
    for (size_t i = 0; i < panels_.size(); ++i) {
        anchors[i] = capturePosition(panels_[i], sequence(panels_[i].content));
    }

    mutate();

    for (size_t i = 0; i < panels_.size(); ++i) {
        const bool tail = options_.followTail && panels_[i].content.kind == ContentKind::MessageList;
        const auto seq = sequence(panels_[i].content);
        restorePosition(panels_[i], anchors[i], seq, viewport(i, seq), tail);
    }
    touch();
}

ChatEntity& ViewStateStore::ensureChatEntry(ChatId id) {
    auto it = chats_.find(id);
    if (it != chats_.end()) {
        return it->second;
    }
    ChatEntity placeholder;
    placeholder.id = id;
    placeholder.name = "Chat " + std::to_string(id);
    auto& entry = chats_.emplace(id, std::move(placeholder)).first->second;
    placeChat(id);
    return entry;
}

void ViewStateStore::placeFolder(FolderId id) {
    folderOrder_.erase(std::remove(folderOrder_.begin(), folderOrder_.end(), id), folderOrder_.end());
    const int position = folders_.at(id).position;
    auto pos = std::upper_bound(folderOrder_.begin(), folderOrder_.end(), position,
        [this](int value, FolderId other) { return value < folders_.at(other).position; });
    folderOrder_.insert(pos, id);
}

void ViewStateStore::placeChat(ChatId id) {
    allChatsOrder_.erase(std::remove(allChatsOrder_.begin(), allChatsOrder_.end(), id), allChatsOrder_.end());
    const int64_t activity = chats_.at(id).lastActivity;
    // 按活跃时间倒序，相同时间保持先来后到
    auto pos = std::find_if(allChatsOrder_.begin(), allChatsOrder_.end(),
        [this, activity](ChatId other) { return chats_.at(other).lastActivity < activity; });
    allChatsOrder_.insert(pos, id);
}

void ViewStateStore::recomputeFolderUnread() {
    for (auto& [folderId, folder] : folders_) {
        int unread = 0;
        for (ChatId chatId : folder.chatIds) {
            auto it = chats_.find(chatId);
            if (it != chats_.end()) {
                unread += it->second.unreadCount;
            }
        }
        folder.unreadCount = unread;
    }
}

bool ViewStateStore::isMessageShown(ChatId chatId, size_t messageIndex) const {
    for (size_t i = 0; i < panels_.size(); ++i) {
        const auto& ps = panels_[i];
        if (ps.content != PaneContent::messages(chatId)) {
            continue;
        }
        if (ps.cursor && *ps.cursor == messageIndex) {
            return true;
        }
        const auto seq = sequence(ps.content);
        if (messageIndex >= ps.scrollOffset &&
            messageIndex < ps.scrollOffset + viewport(i, seq).fit(ps.scrollOffset, seq.size())) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// 实体变更
// =============================================================================

bool ViewStateStore::upsertFolder(const FolderEntity& folder) {
    if (folder.id == ALL_CHATS_FOLDER_ID && options_.showAllChats) {
        LOG() << "[ViewStateStore] Folder id " << folder.id << " is reserved, update ignored";
        return false;
    }

    bool inserted = false;
    reshape([&] {
        FolderEntity incoming = folder;
        std::unordered_set<ChatId> seen;
        incoming.chatIds.clear();
        for (ChatId chatId : folder.chatIds) {
            if (seen.insert(chatId).second) {
                incoming.chatIds.push_back(chatId);
                ensureChatEntry(chatId);
            }
        }

        auto it = folders_.find(folder.id);
        if (it == folders_.end()) {
            folders_.emplace(folder.id, std::move(incoming));
            placeFolder(folder.id);
            inserted = true;
        } else {
            const bool moved = it->second.position != incoming.position;
            it->second = std::move(incoming);
            if (moved) {
                placeFolder(folder.id);
            }
        }
        recomputeFolderUnread();
    });
    return inserted;
}

bool ViewStateStore::removeFolder(FolderId id) {
    auto found = folders_.find(id);
    if (found == folders_.end()) {
        return false;
    }
    const std::string name = found->second.name;

    std::optional<PositionAnchor> leftOverride;
    auto& left = panels_[0];
    if (left.content == PaneContent::chats(id)) {
        const bool leftFocused = left.focused;
        auto rit = std::find_if(backStack_.rbegin(), backStack_.rend(),
            [](const NavigationEntry& e) { return e.left.content.kind == ContentKind::FolderList; });
        if (rit != backStack_.rend()) {
            const size_t k = static_cast<size_t>(std::distance(rit, backStack_.rend())) - 1;
            left = backStack_[k].left;
            leftOverride = backStack_[k].leftAnchor;
            backStack_.resize(k);
        } else {
            left = PanelState{};
            left.content = PaneContent::folders();
            leftOverride = PositionAnchor{};
        }
        left.focused = leftFocused;
    }
    backStack_.erase(std::remove_if(backStack_.begin(), backStack_.end(),
        [id](const NavigationEntry& e) { return e.left.content == PaneContent::chats(id); }),
        backStack_.end());

    std::array<PositionAnchor, 2> anchors;
    for (size_t i = 0; i < panels_.size(); ++i) {
        anchors[i] = capturePosition(panels_[i], sequence(panels_[i].content));
    }
    if (leftOverride) {
        anchors[0] = *leftOverride;
    }

    folders_.erase(id);
    folderOrder_.erase(std::remove(folderOrder_.begin(), folderOrder_.end(), id), folderOrder_.end());

    for (size_t i = 0; i < panels_.size(); ++i) {
        const auto seq = sequence(panels_[i].content);
        restorePosition(panels_[i], anchors[i], seq, viewport(i, seq));
    }
    if (leftOverride) {
        status_ = "Folder \"" + name + "\" was removed";
    }
    touch();
    return true;
}

bool ViewStateStore::upsertChat(const ChatEntity& chat) {
    auto it = chats_.find(chat.id);
    if (it == chats_.end()) {
        reshape([&] {
            ChatEntity entry = chat;
            entry.messageIds.clear();
            entry.typingUser.clear();
            entry.typingUntilMs = 0;
            chats_.emplace(chat.id, std::move(entry));
            placeChat(chat.id);
            recomputeFolderUnread();
        });
        return true;
    }

    ChatEntity& entry = it->second;
    if (!chat.name.empty()) {
        entry.name = chat.name;
    }
    entry.lastPreview = chat.lastPreview;
    entry.unreadCount = std::max(0, chat.unreadCount);
    if (chat.lastActivity > entry.lastActivity) {
        reshape([&] {
            entry.lastActivity = chat.lastActivity;
            placeChat(chat.id);
            recomputeFolderUnread();
        });
    } else {
        recomputeFolderUnread();
        touch();
    }
    return false;
}

bool ViewStateStore::ensureChat(ChatId id) {
    if (chats_.count(id) != 0) {
        return false;
    }
    reshape([&] { ensureChatEntry(id); });
    return true;
}

bool ViewStateStore::removeChat(ChatId id) {
    if (chats_.count(id) == 0) {
        return false;
    }

    reshape([&] {
        chats_.erase(id);
        messages_.erase(id);
        allChatsOrder_.erase(std::remove(allChatsOrder_.begin(), allChatsOrder_.end(), id), allChatsOrder_.end());
        for (auto& [folderId, folder] : folders_) {
            folder.chatIds.erase(std::remove(folder.chatIds.begin(), folder.chatIds.end(), id),
                                 folder.chatIds.end());
        }
        recomputeFolderUnread();
    });

    const PaneContent gone = PaneContent::messages(id);
    auto& right = panels_[1];
    if (right.content == gone) {
        const bool wasFocused = right.focused;
        right = PanelState{};
        if (wasFocused) {
            panels_[0].focused = true;
        }
    }
    for (auto& entry : backStack_) {
        if (entry.right.content == gone) {
            const bool wasFocused = entry.right.focused;
            entry.right = PanelState{};
            entry.rightAnchor = PositionAnchor{};
            if (wasFocused) {
                entry.left.focused = true;
            }
        }
    }
    touch();
    return true;
}

bool ViewStateStore::touchChat(ChatId id, int64_t activity) {
    auto it = chats_.find(id);
    if (it == chats_.end() || activity <= it->second.lastActivity) {
        return false;
    }
    reshape([&] {
        it->second.lastActivity = activity;
        placeChat(id);
    });
    return true;
}

bool ViewStateStore::setChatSummary(ChatId id, const std::string& preview, int unreadCount) {
    auto it = chats_.find(id);
    if (it == chats_.end()) {
        return false;
    }
    unreadCount = std::max(0, unreadCount);
    if (it->second.lastPreview == preview && it->second.unreadCount == unreadCount) {
        return false;
    }
    it->second.lastPreview = preview;
    it->second.unreadCount = unreadCount;
    recomputeFolderUnread();
    touch();
    return true;
}

UpsertResult ViewStateStore::upsertMessage(ChatId chatId, const MessageEntity& message) {
    ensureChat(chatId);
    auto& bucket = messages_[chatId];

    auto existing = bucket.find(message.id);
    if (existing != bucket.end()) {
        MessageEntity merged = existing->second;
        merged.text = message.text;
        merged.image = message.image;
        merged.edited = existing->second.edited || message.edited;
        merged.read = existing->second.read || message.read;
        merged.deleted = existing->second.deleted || message.deleted;
        if (sameContent(merged, existing->second)) {
            return UpsertResult::Unchanged;
        }
        existing->second = std::move(merged);
        touch();
        return UpsertResult::Updated;
    }

    reshape([&] {
        bucket.emplace(message.id, message);
        auto& ids = chats_.at(chatId).messageIds;
        auto pos = std::upper_bound(ids.begin(), ids.end(), message,
            [&bucket](const MessageEntity& m, MessageId other) {
                const auto& o = bucket.at(other);
                return m.timestamp != o.timestamp ? m.timestamp < o.timestamp : m.id < o.id;
            });
        ids.insert(pos, message.id);
    });
    return UpsertResult::Inserted;
}

bool ViewStateStore::markDeleted(ChatId chatId, MessageId messageId) {
    auto bucket = messages_.find(chatId);
    if (bucket == messages_.end()) {
        return false;
    }
    auto it = bucket->second.find(messageId);
    if (it == bucket->second.end() || it->second.deleted) {
        return false;
    }
    it->second.deleted = true;
    touch();
    return true;
}

size_t ViewStateStore::markRead(ChatId chatId, MessageId uptoId) {
    auto chat = chats_.find(chatId);
    auto bucket = messages_.find(chatId);
    if (chat == chats_.end() || bucket == messages_.end()) {
        return 0;
    }
    const auto& ids = chat->second.messageIds;
    auto upto = std::find(ids.begin(), ids.end(), uptoId);
    if (upto == ids.end()) {
        return 0;
    }

    size_t marked = 0;
    for (auto it = ids.begin(); it != std::next(upto); ++it) {
        auto& m = bucket->second.at(*it);
        if (!m.read) {
            m.read = true;
            ++marked;
        }
    }
    if (marked > 0) {
        chat->second.unreadCount = std::max(0, chat->second.unreadCount - static_cast<int>(marked));
        recomputeFolderUnread();
        touch();
    }
    return marked;
}

size_t ViewStateStore::compact(ChatId chatId) {
    auto chat = chats_.find(chatId);
    auto bucket = messages_.find(chatId);
    if (chat == chats_.end() || bucket == messages_.end()) {
        return 0;
    }

    const auto& ids = chat->second.messageIds;
    std::unordered_set<MessageId> doomed;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (bucket->second.at(ids[i]).deleted && !isMessageShown(chatId, i)) {
            doomed.insert(ids[i]);
        }
    }

    // 正在显示的会话不裁剪，避免刚拉取的历史被立刻丢弃
    const bool shown = panels_[0].content == PaneContent::messages(chatId) ||
                       panels_[1].content == PaneContent::messages(chatId);
    if (!shown) {
        size_t remaining = ids.size() - doomed.size();
        for (size_t i = 0; i < ids.size() && remaining > options_.maxMessages; ++i) {
            if (doomed.insert(ids[i]).second) {
                --remaining;
            }
        }
    }

    if (doomed.empty()) {
        return 0;
    }

    reshape([&] {
        auto& list = chat->second.messageIds;
        list.erase(std::remove_if(list.begin(), list.end(),
            [&doomed](MessageId id) { return doomed.count(id) != 0; }), list.end());
        for (MessageId id : doomed) {
            bucket->second.erase(id);
        }
    });
    return doomed.size();
}

bool ViewStateStore::setTyping(ChatId chatId, const std::string& user, int64_t untilMs) {
    ensureChat(chatId);
    auto& chat = chats_.at(chatId);
    if (chat.typingUser == user && chat.typingUntilMs == untilMs) {
        return false;
    }
    chat.typingUser = user;
    chat.typingUntilMs = untilMs;
    touch();
    return true;
}

bool ViewStateStore::clearTyping(ChatId chatId) {
    auto it = chats_.find(chatId);
    if (it == chats_.end() || it->second.typingUser.empty()) {
        return false;
    }
    it->second.typingUser.clear();
    it->second.typingUntilMs = 0;
    touch();
    return true;
}

size_t ViewStateStore::clearExpiredTyping(int64_t nowMs) {
    size_t cleared = 0;
    for (auto& [chatId, chat] : chats_) {
        if (!chat.typingUser.empty() && chat.typingUntilMs <= nowMs) {
            chat.typingUser.clear();
            chat.typingUntilMs = 0;
            ++cleared;
        }
    }
    if (cleared > 0) {
        touch();
    }
    return cleared;
}

// =============================================================================
// 导航
// =============================================================================

bool ViewStateStore::setFocus(Pane pane) {
    if (panels_[index(pane)].focused) {
        return false;
    }
    panels_[index(pane)].focused = true;
    panels_[index(otherPane(pane))].focused = false;
    touch();
    return true;
}

bool ViewStateStore::moveCursor(Pane pane, int delta) {
    auto& ps = panels_[index(pane)];
    const size_t n = sequence(ps.content).size();
    if (n == 0 || delta == 0) {
        return false;
    }
    const long current = static_cast<long>(ps.cursor.value_or(0));
    const long target = std::clamp(current + delta, 0L, static_cast<long>(n) - 1);
    if (target == current) {
        return false;
    }
    ps.cursor = static_cast<size_t>(target);
    ensureCursorVisible(ps, n, viewport(index(pane), sequence(ps.content)));
    touch();
    return true;
}

bool ViewStateStore::jumpCursor(Pane pane, bool toEnd) {
    auto& ps = panels_[index(pane)];
    const size_t n = sequence(ps.content).size();
    if (n == 0) {
        return false;
    }
    const size_t target = toEnd ? n - 1 : 0;
    if (ps.cursor && *ps.cursor == target) {
        return false;
    }
    ps.cursor = target;
    ensureCursorVisible(ps, n, viewport(index(pane), sequence(ps.content)));
    touch();
    return true;
}

bool ViewStateStore::openSelected() {
    if (focusedPane() != Pane::Left) {
        return false;
    }
    auto& left = panels_[0];
    auto& right = panels_[1];
    const auto seq = sequence(left.content);
    if (!left.cursor || *left.cursor >= seq.size()) {
        return false;
    }
    const int64_t id = seq[*left.cursor];

    NavigationEntry entry;
    entry.left = left;
    entry.right = right;
    entry.leftAnchor = capturePosition(left, seq);
    entry.rightAnchor = capturePosition(right, sequence(right.content));

    if (left.content.kind == ContentKind::FolderList) {
        if (!folderInfo(id)) {
            return false;
        }
        backStack_.push_back(std::move(entry));
        left.content = PaneContent::chats(id);
        left.cursor.reset();
        left.scrollOffset = 0;
        ensureCursorVisible(left, sequence(left.content).size(), rows_[0]);
        touch();
        return true;
    }

    if (left.content.kind == ContentKind::ChatList) {
        if (chats_.count(id) == 0) {
            return false;
        }
        backStack_.push_back(std::move(entry));
        right.content = PaneContent::messages(id);
        right.cursor.reset();
        right.scrollOffset = 0;
        const auto messages = sequence(right.content);
        ensureCursorVisible(right, messages.size(), viewport(1, messages));
        left.focused = false;
        right.focused = true;
        touch();
        return true;
    }
    return false;
}

bool ViewStateStore::goBack() {
    if (backStack_.empty()) {
        return false;
    }
    NavigationEntry entry = std::move(backStack_.back());
    backStack_.pop_back();

    panels_[0] = entry.left;
    panels_[1] = entry.right;
    for (size_t i = 0; i < panels_.size(); ++i) {
        const auto seq = sequence(panels_[i].content);
        restorePosition(panels_[i], i == 0 ? entry.leftAnchor : entry.rightAnchor, seq, viewport(i, seq));
    }

    if (panels_[0].focused == panels_[1].focused) {
        panels_[0].focused = true;
        panels_[1].focused = false;
    }
    touch();
    return true;
}

bool ViewStateStore::setViewportRows(Pane pane, size_t rows) {
    rows = std::max<size_t>(rows, 1);
    if (rows_[index(pane)] == rows) {
        return false;
    }
    rows_[index(pane)] = rows;
    auto& ps = panels_[index(pane)];
    const auto seq = sequence(ps.content);
    ensureCursorVisible(ps, seq.size(), viewport(index(pane), seq));
    touch();
    return true;
}

void ViewStateStore::setMessageHeight(MessageHeight height) {
    messageHeight_ = std::move(height);
    fitViewport(Pane::Right);
}

bool ViewStateStore::fitViewport(Pane pane) {
    auto& ps = panels_[index(pane)];
    const auto seq = sequence(ps.content);
    const PanelState before = ps;
    ensureCursorVisible(ps, seq.size(), viewport(index(pane), seq));
    if (before.cursor == ps.cursor && before.scrollOffset == ps.scrollOffset) {
        return false;
    }
    touch();
    return true;
}

Viewport ViewStateStore::viewport(size_t i, const std::vector<int64_t>& seq) const {
    Viewport vp(rows_[i]);
    const auto& content = panels_[i].content;
    if (i == 1 && content.kind == ContentKind::MessageList && messageHeight_) {
        const ChatId chatId = content.id;
        vp.rowHeight = [this, chatId, &seq](size_t idx) -> size_t {
            const auto* m = idx < seq.size() ? findMessage(chatId, seq[idx]) : nullptr;
            return m ? messageHeight_(*m) : 1;
        };
    }
    return vp;
}

void ViewStateStore::setStatus(const std::string& status) {
    if (status_ == status) {
        return;
    }
    status_ = status;
    touch();
}

bool ViewStateStore::repair() {
    bool fixed = false;
    if (panels_[0].focused == panels_[1].focused) {
        panels_[0].focused = true;
        panels_[1].focused = false;
        fixed = true;
    }
    for (size_t i = 0; i < panels_.size(); ++i) {
        const PanelState before = panels_[i];
        const auto seq = sequence(panels_[i].content);
        ensureCursorVisible(panels_[i], seq.size(), viewport(i, seq));
        if (before.cursor != panels_[i].cursor || before.scrollOffset != panels_[i].scrollOffset) {
            fixed = true;
        }
    }
    if (fixed) {
        touch();
    }
    return fixed;
}

} // namespace paneltalk
