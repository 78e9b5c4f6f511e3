#include <catch2/catch.hpp>
#include "state/input_dispatcher.hpp"
#include "fixtures.hpp"

using namespace paneltalk;
using namespace paneltalk::test;

namespace {

struct DispatcherFixture {
    ViewStateStore store;
    ErrorCounters errors;
    InputDispatcher dispatcher{store, errors};

    DispatchResult press(Key key) { return dispatcher.dispatch(UserInput{key}); }

    void seedChats(int count) {
        std::vector<ChatId> ids;
        for (int i = 0; i < count; ++i) {
            store.upsertChat(makeChat(100 + i, "chat" + std::to_string(i), 1000 - i));
            ids.push_back(100 + i);
        }
        store.upsertFolder(makeFolder(1, "Inbox", ids));
    }
};

} // anonymous namespace

TEST_CASE_METHOD(DispatcherFixture, "Tab toggles focus between panes", "[dispatcher]") {
    REQUIRE(store.focusedPane() == Pane::Left);

    REQUIRE(press(Key::Tab).changed);
    REQUIRE(store.focusedPane() == Pane::Right);
    REQUIRE(store.invariantsHold());

    REQUIRE(press(Key::Tab).changed);
    REQUIRE(store.focusedPane() == Pane::Left);
}

TEST_CASE_METHOD(DispatcherFixture, "Navigation in an empty pane is a counted no-op", "[dispatcher]") {
    press(Key::Tab);
    const auto version = store.version();

    REQUIRE_FALSE(press(Key::Down).changed);
    REQUIRE_FALSE(press(Key::Up).changed);
    REQUIRE_FALSE(press(Key::End).changed);

    REQUIRE(errors.count(ErrorKind::EmptyPaneNavigation) == 3);
    REQUIRE(store.version() == version);
    REQUIRE_FALSE(store.panel(Pane::Right).cursor.has_value());
}

TEST_CASE_METHOD(DispatcherFixture, "Up and Down clamp at the edges", "[dispatcher]") {
    seedChats(2);

    REQUIRE_FALSE(press(Key::Up).changed);
    REQUIRE(press(Key::Down).changed);
    REQUIRE_FALSE(press(Key::Down).changed);
    REQUIRE(store.panel(Pane::Left).cursor == 1u);
    REQUIRE(errors.count(ErrorKind::EmptyPaneNavigation) == 2);
}

TEST_CASE_METHOD(DispatcherFixture, "Enter and Esc walk the hierarchy", "[dispatcher]") {
    seedChats(3);

    press(Key::Down);                       // Inbox
    REQUIRE(press(Key::Enter).changed);
    REQUIRE(store.mode() == NavMode::ChatsPane);

    press(Key::Down);
    REQUIRE(press(Key::Enter).changed);
    REQUIRE(store.mode() == NavMode::MessagesPane);
    REQUIRE(store.panel(Pane::Right).content == PaneContent::messages(101));

    // 消息面板中 Enter 无动作，也不计错误
    const auto before = errors.count(ErrorKind::EmptyPaneNavigation);
    REQUIRE_FALSE(press(Key::Enter).changed);
    REQUIRE(errors.count(ErrorKind::EmptyPaneNavigation) == before);

    REQUIRE(press(Key::Esc).changed);
    REQUIRE(store.mode() == NavMode::ChatsPane);
    REQUIRE(store.selectedId(Pane::Left) == 101);

    REQUIRE(press(Key::Esc).changed);
    REQUIRE(store.mode() == NavMode::FoldersPane);
    REQUIRE(store.selectedId(Pane::Left) == 1);

    REQUIRE_FALSE(press(Key::Esc).changed);
}

TEST_CASE_METHOD(DispatcherFixture, "Page and Home/End keys", "[dispatcher]") {
    seedChats(30);
    press(Key::Down);
    press(Key::Enter);
    dispatcher.resize(Resize{10, 10});

    REQUIRE(press(Key::PageDown).changed);
    REQUIRE(store.panel(Pane::Left).cursor == 10u);

    REQUIRE(press(Key::End).changed);
    REQUIRE(store.panel(Pane::Left).cursor == 29u);
    REQUIRE(store.panel(Pane::Left).scrollOffset == 20u);

    REQUIRE(press(Key::PageUp).changed);
    REQUIRE(store.panel(Pane::Left).cursor == 19u);

    REQUIRE(press(Key::Home).changed);
    REQUIRE(store.panel(Pane::Left).cursor == 0u);
    REQUIRE(store.panel(Pane::Left).scrollOffset == 0u);
}

TEST_CASE_METHOD(DispatcherFixture, "Ctrl+Q requests quit without touching state", "[dispatcher]") {
    const auto version = store.version();
    auto result = press(Key::CtrlQ);

    REQUIRE(result.quit);
    REQUIRE_FALSE(result.changed);
    REQUIRE(store.version() == version);
}

TEST_CASE_METHOD(DispatcherFixture, "Unknown keys are ignored", "[dispatcher]") {
    auto result = press(Key::Other);
    REQUIRE_FALSE(result.changed);
    REQUIRE_FALSE(result.quit);
    REQUIRE(errors.count(ErrorKind::EmptyPaneNavigation) == 0);
}

TEST_CASE_METHOD(DispatcherFixture, "Resize updates both viewports", "[dispatcher]") {
    seedChats(5);
    press(Key::Down);
    press(Key::Enter);
    press(Key::End);

    REQUIRE(dispatcher.resize(Resize{2, 7}).changed);
    REQUIRE(store.viewportRows(Pane::Left) == 2u);
    REQUIRE(store.viewportRows(Pane::Right) == 7u);
    REQUIRE(store.panel(Pane::Left).scrollOffset == 3u);

    REQUIRE_FALSE(dispatcher.resize(Resize{2, 7}).changed);
}
