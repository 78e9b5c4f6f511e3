#include <catch2/catch.hpp>
#include "app/pane_app.hpp"
#include "fixtures.hpp"

using namespace paneltalk;
using namespace paneltalk::test;

namespace {

/**
 * @brief 可编排的会话适配器：start() 时依次投递预设事件
 */
class ScriptedAdapter : public SessionAdapter {
public:
    ScriptedAdapter(EventQueue& events, bool startOk, std::vector<Event> script)
        : SessionAdapter(events)
        , startOk_(startOk)
        , script_(std::move(script)) {}

    bool start() override {
        if (!startOk_) {
            return false;
        }
        running_ = true;
        for (auto& event : script_) {
            pushEvent(std::move(event));
        }
        return true;
    }

    void stop() override { running_ = false; ++stops; }
    bool isRunning() const override { return running_; }
    AdapterState getState() const override {
        return running_ ? AdapterState::READY : AdapterState::DISCONNECTED;
    }

    void fetchMore(ChatId chatId, MessageId before) override { fetches.push_back(FetchMore{chatId, before}); }
    void markRead(ChatId chatId, MessageId messageId) override { reads.push_back(MarkRead{chatId, messageId}); }

    void setStateCallback(StateCallback) override {}
    std::string getName() const override { return "Scripted"; }

    std::vector<FetchMore> fetches;
    std::vector<MarkRead> reads;
    int stops = 0;

private:
    bool startOk_;
    bool running_ = false;
    std::vector<Event> script_;
};

InitialSnapshot inboxSnapshot() {
    InitialSnapshot snapshot;
    snapshot.chats = {makeChat(10, "Alice", 1000, 1)};
    snapshot.folders = {makeFolder(1, "Inbox", {10})};
    snapshot.messages = {MessageUpsert{10, makeMessage(1, 1000, "hi", false)}};
    return snapshot;
}

struct AppFixture {
    ScriptedAdapter* adapter = nullptr;
    std::unique_ptr<PaneApp> app;

    explicit AppFixture(bool startOk = true, std::vector<Event> script = {}) {
        app = std::make_unique<PaneApp>(AppOptions(), [this, startOk, script](EventQueue& q) {
            auto a = std::make_unique<ScriptedAdapter>(q, startOk, script);
            adapter = a.get();
            return a;
        });
    }

    bool press(Key key) { return app->process(UserInput{key}); }
};

} // anonymous namespace

TEST_CASE("Ctrl+Q ends the loop with exit code 0", "[pane_app]") {
    AppFixture f;
    REQUIRE_FALSE(f.press(Key::CtrlQ));
    REQUIRE(f.app->exitCode() == EXIT_OK);
    REQUIRE(f.app->stats().userInputs == 1);
}

TEST_CASE("Snapshot populates the rendered view", "[pane_app]") {
    AppFixture f;
    REQUIRE(f.app->process(inboxSnapshot()));

    auto snap = f.app->renderer().latest();
    REQUIRE(snap != nullptr);
    REQUIRE(snap->status == "Connected (Scripted)");
    REQUIRE(snap->left.rows.size() == 2);
    REQUIRE(snap->left.rows[1].lines[0] == "(1) Inbox [1]");
}

TEST_CASE("Session failure ends the loop with exit code 2", "[pane_app]") {
    AppFixture f;
    REQUIRE_FALSE(f.app->process(SessionFailure{"connection reset"}));
    REQUIRE(f.app->exitCode() == EXIT_SESSION_FAILURE);
    REQUIRE(f.app->store().status() == "Session failed: connection reset");
    REQUIRE(f.app->renderer().latest()->status == "Session failed: connection reset");
}

TEST_CASE("Opening a chat forwards MarkRead and FetchMore", "[pane_app]") {
    AppFixture f;
    f.app->process(inboxSnapshot());

    f.press(Key::Down);     // Inbox
    f.press(Key::Enter);
    f.press(Key::Enter);    // Alice

    REQUIRE(f.app->store().mode() == NavMode::MessagesPane);
    REQUIRE(f.adapter->reads.size() == 1);
    REQUIRE(f.adapter->reads[0] == MarkRead{10, 1});
    REQUIRE(f.adapter->fetches.size() == 1);
    REQUIRE(f.adapter->fetches[0] == FetchMore{10, 1});
    REQUIRE(f.app->stats().actionsSent == 2);
    REQUIRE(f.app->store().findChat(10)->unreadCount == 0);

    // 同一起点不重复请求
    f.app->process(Tick{});
    REQUIRE(f.adapter->fetches.size() == 1);
}

TEST_CASE("Remote updates reach the view", "[pane_app]") {
    AppFixture f;
    f.app->process(inboxSnapshot());
    f.app->process(RemoteUpdate{MessageUpsert{10, makeMessage(2, 2000, "again", false, "Bob")}});

    REQUIRE(f.app->stats().remoteUpdates == 1);
    REQUIRE(f.app->store().findChat(10)->unreadCount == 2);
    REQUIRE(f.app->store().findChat(10)->lastPreview == "Bob: again");
}

TEST_CASE("Resize and Tick events", "[pane_app]") {
    AppFixture f;
    f.app->process(Resize{4, 6});
    REQUIRE(f.app->store().viewportRows(Pane::Left) == 4u);
    REQUIRE(f.app->store().viewportRows(Pane::Right) == 6u);

    const auto frame = f.app->renderer().latest()->frame;
    f.app->process(Tick{});
    REQUIRE(f.app->stats().ticks == 1);
    REQUIRE(f.app->renderer().latest()->frame == frame + 1);
}

TEST_CASE("Empty pane navigation is counted", "[pane_app]") {
    AppFixture f;
    f.press(Key::Tab);
    f.press(Key::Down);
    REQUIRE(f.app->errors().count(ErrorKind::EmptyPaneNavigation) == 1);
    REQUIRE(f.app->store().invariantsHold());
}

TEST_CASE("run returns 2 when the adapter fails to start", "[pane_app]") {
    AppFixture f(false);
    int handled = -1;
    f.app->setExitHandler([&handled](int code) { handled = code; });

    REQUIRE(f.app->run() == EXIT_SESSION_FAILURE);
    REQUIRE(handled == EXIT_SESSION_FAILURE);
}

TEST_CASE("run returns 2 without an adapter", "[pane_app]") {
    PaneApp app(AppOptions(), nullptr);
    REQUIRE(app.adapter() == nullptr);
    REQUIRE(app.run() == EXIT_SESSION_FAILURE);
}

TEST_CASE("run processes events until Ctrl+Q", "[pane_app]") {
    AppFixture f(true, {Event{inboxSnapshot()}, Event{UserInput{Key::Down}}, Event{UserInput{Key::CtrlQ}}});
    int handled = -1;
    f.app->setExitHandler([&handled](int code) { handled = code; });

    REQUIRE(f.app->run() == EXIT_OK);
    REQUIRE(handled == EXIT_OK);
    REQUIRE(f.app->stats().userInputs == 2);
    REQUIRE(f.app->store().selectedId(Pane::Left) == 1);
    REQUIRE(f.adapter->stops >= 1);
    REQUIRE(f.app->events().stopped());
}

TEST_CASE("run ends on session failure", "[pane_app]") {
    AppFixture f(true, {Event{inboxSnapshot()}, Event{SessionFailure{"gone"}}});
    REQUIRE(f.app->run() == EXIT_SESSION_FAILURE);
    REQUIRE(f.app->store().status() == "Session failed: gone");
}
