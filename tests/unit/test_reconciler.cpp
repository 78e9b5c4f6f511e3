#include <catch2/catch.hpp>
#include "state/reconciler.hpp"
#include "fixtures.hpp"
#include <algorithm>

using namespace paneltalk;
using namespace paneltalk::test;

namespace {

struct ReconcilerFixture {
    ViewStateStore store;
    ErrorCounters errors;
    Reconciler reconciler{store, errors};

    ReconcilerFixture() {
        InitialSnapshot snapshot;
        snapshot.chats = {makeChat(1, "Alice", 100), makeChat(2, "Bob", 200, 2)};
        snapshot.folders = {makeFolder(10, "Friends", {1, 2})};
        reconciler.applySnapshot(snapshot);
    }

    bool apply(RemoteUpdate update, int64_t nowMs = 0) {
        return reconciler.apply(update, nowMs);
    }

    // 打开 Friends 中的 Alice，焦点移到消息面板
    void openAlice() {
        store.moveCursor(Pane::Left, 1);
        store.openSelected();
        store.openSelected();
    }
};

template <typename T>
size_t countOf(const std::vector<OutboundAction>& actions) {
    return static_cast<size_t>(std::count_if(actions.begin(), actions.end(),
        [](const OutboundAction& a) { return std::holds_alternative<T>(a); }));
}

} // anonymous namespace

TEST_CASE_METHOD(ReconcilerFixture, "Snapshot unread counts are authoritative", "[reconciler]") {
    InitialSnapshot snapshot;
    snapshot.messages = {
        MessageUpsert{2, makeMessage(1, 150, "hey", false, "Bob")},
        MessageUpsert{2, makeMessage(2, 160, "there", false, "Bob")},
    };
    reconciler.applySnapshot(snapshot);

    REQUIRE(store.findChat(2)->unreadCount == 2);
    REQUIRE(store.messageCount(2) == 2);
    REQUIRE(store.folderInfo(10)->unreadCount == 2);
    REQUIRE(errors.count(ErrorKind::UnknownUpdateEntity) == 0);
}

TEST_CASE_METHOD(ReconcilerFixture, "New message updates preview, unread and activity", "[reconciler]") {
    REQUIRE(store.sequence(PaneContent::chats(ALL_CHATS_FOLDER_ID)) == std::vector<int64_t>{2, 1});

    REQUIRE(apply(MessageUpsert{1, makeMessage(50, 300, "hi", false, "Carol")}));

    const auto* chat = store.findChat(1);
    REQUIRE(chat->unreadCount == 1);
    REQUIRE(chat->lastPreview == "Carol: hi");
    REQUIRE(chat->lastActivity == 300);
    REQUIRE(store.sequence(PaneContent::chats(ALL_CHATS_FOLDER_ID)) == std::vector<int64_t>{1, 2});
}

TEST_CASE_METHOD(ReconcilerFixture, "Older history does not touch summary", "[reconciler]") {
    apply(MessageUpsert{1, makeMessage(50, 300, "latest", false, "Carol")});
    apply(MessageUpsert{1, makeMessage(40, 250, "older", false, "Carol")});

    const auto* chat = store.findChat(1);
    REQUIRE(chat->unreadCount == 1);
    REQUIRE(chat->lastPreview == "Carol: latest");
    REQUIRE(chat->messageIds == std::vector<MessageId>{40, 50});
}

TEST_CASE_METHOD(ReconcilerFixture, "Edit keeps unread count", "[reconciler]") {
    apply(MessageUpsert{1, makeMessage(50, 300, "hi", false, "Carol")});

    auto edited = makeMessage(50, 300, "hello", false, "Carol");
    edited.edited = true;
    REQUIRE(apply(MessageUpsert{1, edited}));

    const auto* chat = store.findChat(1);
    REQUIRE(chat->unreadCount == 1);
    REQUIRE(chat->lastPreview == "Carol: hello");
    REQUIRE(store.findMessage(1, 50)->edited);

    // 重复投递同一内容不产生变化
    REQUIRE_FALSE(apply(MessageUpsert{1, edited}));
}

TEST_CASE_METHOD(ReconcilerFixture, "Editing a visible message keeps cursor and scroll", "[reconciler]") {
    for (int i = 0; i < 10; ++i) {
        apply(MessageUpsert{1, makeMessage(10 + i, 1000 + i, "m")});
    }
    store.setViewportRows(Pane::Right, 3);
    openAlice();
    store.moveCursor(Pane::Right, 6);
    REQUIRE(store.panel(Pane::Right).cursor == 6u);
    REQUIRE(store.panel(Pane::Right).scrollOffset == 4u);
    const auto before = store.sequence(Pane::Right);

    auto edited = makeMessage(15, 1005, "m (fixed)");
    edited.edited = true;
    REQUIRE(apply(MessageUpsert{1, edited}));

    REQUIRE(store.findMessage(1, 15)->text == "m (fixed)");
    REQUIRE(store.panel(Pane::Right).cursor == 6u);
    REQUIRE(store.panel(Pane::Right).scrollOffset == 4u);
    REQUIRE(store.selectedId(Pane::Right) == 16);
    REQUIRE(store.sequence(Pane::Right) == before);
}

TEST_CASE_METHOD(ReconcilerFixture, "Image-only message previews as image", "[reconciler]") {
    auto m = makeMessage(60, 400, "", false, "Dan");
    m.image = makeImage("img-1", {1, 2, 3});
    apply(MessageUpsert{2, m});

    REQUIRE(store.findChat(2)->lastPreview == "Dan: [image]");
}

TEST_CASE_METHOD(ReconcilerFixture, "Message for unknown chat creates a placeholder", "[reconciler][unknown]") {
    REQUIRE(apply(MessageUpsert{77, makeMessage(1, 500, "who?", false, "Eve")}));

    const auto* chat = store.findChat(77);
    REQUIRE(chat != nullptr);
    REQUIRE(chat->name == "Chat 77");
    REQUIRE(chat->unreadCount == 1);
    REQUIRE(errors.count(ErrorKind::UnknownUpdateEntity) == 1);
    REQUIRE(store.sequence(PaneContent::chats(ALL_CHATS_FOLDER_ID)).front() == 77);
}

TEST_CASE_METHOD(ReconcilerFixture, "Unknown removals are counted and ignored", "[reconciler][unknown]") {
    const auto version = store.version();

    REQUIRE_FALSE(apply(FolderRemoved{99}));
    REQUIRE_FALSE(apply(ChatRemoved{99}));
    REQUIRE_FALSE(apply(MessageDeleted{1, 12345}));

    REQUIRE(errors.count(ErrorKind::UnknownUpdateEntity) == 3);
    REQUIRE(store.version() == version);
}

TEST_CASE_METHOD(ReconcilerFixture, "Folder listing unknown chats is counted", "[reconciler][unknown]") {
    apply(FolderChanged{makeFolder(11, "Work", {1, 42})});

    REQUIRE(errors.count(ErrorKind::UnknownUpdateEntity) == 1);
    REQUIRE(store.findChat(42)->name == "Chat 42");
    REQUIRE(store.folderInfo(11)->chatIds == std::vector<ChatId>{1, 42});
}

TEST_CASE_METHOD(ReconcilerFixture, "Deleting the newest message", "[reconciler]") {
    apply(MessageUpsert{1, makeMessage(50, 300, "oops", false, "Carol")});
    REQUIRE(store.findChat(1)->unreadCount == 1);

    REQUIRE(apply(MessageDeleted{1, 50}));
    const auto* chat = store.findChat(1);
    REQUIRE(chat->unreadCount == 0);
    REQUIRE(chat->lastPreview == "[message deleted]");

    // 再次删除不产生变化
    REQUIRE_FALSE(apply(MessageDeleted{1, 50}));
}

TEST_CASE_METHOD(ReconcilerFixture, "Chat rename keeps position", "[reconciler]") {
    store.moveCursor(Pane::Left, 1);
    store.openSelected();
    store.moveCursor(Pane::Left, 1);
    REQUIRE(store.selectedId(Pane::Left) == 2);

    auto renamed = makeChat(2, "Robert", 200, 2);
    apply(ChatChanged{renamed});

    REQUIRE(store.findChat(2)->name == "Robert");
    REQUIRE(store.selectedId(Pane::Left) == 2);
    REQUIRE(store.panel(Pane::Left).cursor == 1u);
}

TEST_CASE_METHOD(ReconcilerFixture, "Typing indicator times out on tick", "[reconciler][typing]") {
    REQUIRE(apply(TypingChanged{1, "Alice", true}, 1000));
    REQUIRE(store.findChat(1)->typingUser == "Alice");

    REQUIRE_FALSE(reconciler.onTick(5999));
    REQUIRE(reconciler.onTick(6000));
    REQUIRE(store.findChat(1)->typingUser.empty());

    apply(TypingChanged{1, "Alice", true}, 7000);
    REQUIRE(apply(TypingChanged{1, "Alice", false}, 7100));
    REQUIRE(store.findChat(1)->typingUser.empty());
}

TEST_CASE_METHOD(ReconcilerFixture, "Nothing to sync without an open chat", "[reconciler][sync]") {
    store.moveCursor(Pane::Left, 1);
    store.openSelected();
    REQUIRE(reconciler.syncVisibility().empty());
}

TEST_CASE_METHOD(ReconcilerFixture, "Visible unread messages are marked read", "[reconciler][sync]") {
    InitialSnapshot snapshot;
    for (int i = 0; i < 5; ++i) {
        snapshot.messages.push_back(MessageUpsert{1, makeMessage(10 + i, 1000 + i, "m", false)});
    }
    snapshot.chats = {makeChat(1, "Alice", 1004, 5)};
    reconciler.applySnapshot(snapshot);
    openAlice();

    auto actions = reconciler.syncVisibility();
    REQUIRE(countOf<MarkRead>(actions) == 1);
    REQUIRE(std::find(actions.begin(), actions.end(), OutboundAction{MarkRead{1, 14}}) != actions.end());
    REQUIRE(store.findChat(1)->unreadCount == 0);
    REQUIRE(store.findMessage(1, 10)->read);

    REQUIRE(countOf<MarkRead>(reconciler.syncVisibility()) == 0);
}

TEST_CASE_METHOD(ReconcilerFixture, "Messages below the drawn window stay unread", "[reconciler][sync]") {
    InitialSnapshot snapshot;
    for (int i = 0; i < 5; ++i) {
        snapshot.messages.push_back(MessageUpsert{1, makeMessage(10 + i, 1000 + i, "m", false)});
    }
    snapshot.chats = {makeChat(1, "Alice", 1004, 5)};
    reconciler.applySnapshot(snapshot);
    store.setViewportRows(Pane::Right, 30);
    // 每条消息 12 行，30 行只能放下两条
    store.setMessageHeight([](const MessageEntity&) -> size_t { return 12; });
    openAlice();

    auto actions = reconciler.syncVisibility();
    REQUIRE(countOf<MarkRead>(actions) == 1);
    REQUIRE(std::find(actions.begin(), actions.end(), OutboundAction{MarkRead{1, 11}}) != actions.end());
    REQUIRE(store.findMessage(1, 11)->read);
    REQUIRE_FALSE(store.findMessage(1, 12)->read);
    REQUIRE(store.findChat(1)->unreadCount == 3);
}

TEST_CASE_METHOD(ReconcilerFixture, "Unfocused message pane is not marked read", "[reconciler][sync]") {
    InitialSnapshot snapshot;
    snapshot.messages = {MessageUpsert{1, makeMessage(10, 1000, "m", false)}};
    snapshot.chats = {makeChat(1, "Alice", 1000, 1)};
    reconciler.applySnapshot(snapshot);
    openAlice();
    store.setFocus(Pane::Left);

    REQUIRE(countOf<MarkRead>(reconciler.syncVisibility()) == 0);
    REQUIRE(store.findChat(1)->unreadCount == 1);
}

TEST_CASE_METHOD(ReconcilerFixture, "FetchMore is requested once per oldest message", "[reconciler][sync]") {
    for (int i = 0; i < 10; ++i) {
        apply(MessageUpsert{1, makeMessage(10 + i, 1000 + i, "m")});
    }
    openAlice();
    REQUIRE(store.panel(Pane::Right).cursor == 0u);

    auto actions = reconciler.syncVisibility();
    REQUIRE(actions.size() == 1);
    REQUIRE(std::get<FetchMore>(actions.front()) == FetchMore{1, 10});

    REQUIRE(reconciler.syncVisibility().empty());

    // 拉取到更早的消息，光标仍在原消息上
    apply(MessageUpsert{1, makeMessage(5, 500, "older")});
    REQUIRE(store.selectedId(Pane::Right) == 10);
    REQUIRE(store.panel(Pane::Right).cursor == 1u);

    actions = reconciler.syncVisibility();
    REQUIRE(actions.size() == 1);
    REQUIRE(std::get<FetchMore>(actions.front()) == FetchMore{1, 5});
}

TEST_CASE_METHOD(ReconcilerFixture, "No FetchMore far from the top", "[reconciler][sync]") {
    for (int i = 0; i < 10; ++i) {
        apply(MessageUpsert{1, makeMessage(10 + i, 1000 + i, "m")});
    }
    openAlice();
    store.jumpCursor(Pane::Right, true);

    REQUIRE(countOf<FetchMore>(reconciler.syncVisibility()) == 0);
}

TEST_CASE_METHOD(ReconcilerFixture, "Removing the open chat", "[reconciler]") {
    apply(MessageUpsert{1, makeMessage(10, 1000, "m")});
    openAlice();

    REQUIRE(apply(ChatRemoved{1}));
    REQUIRE(store.panel(Pane::Right).content.kind == ContentKind::Empty);
    REQUIRE(store.focusedPane() == Pane::Left);
    REQUIRE(store.invariantsHold());
}
