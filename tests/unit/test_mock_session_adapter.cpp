#include <catch2/catch.hpp>
#include "session/mock_session_adapter.hpp"
#include "render/image_converter.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

using namespace paneltalk;
using namespace std::chrono_literals;

namespace {

InitialSnapshot takeSnapshot(EventQueue& events) {
    Event event;
    REQUIRE(events.pop_for(event, 2s));
    REQUIRE(std::holds_alternative<InitialSnapshot>(event));
    return std::get<InitialSnapshot>(event);
}

MockSessionOptions quietOptions() {
    MockSessionOptions options;
    options.interval = 10s;
    options.historyPerChat = 5;
    return options;
}

} // anonymous namespace

TEST_CASE("Mock adapter delivers the snapshot first", "[mock_session]") {
    EventQueue events;
    MockSessionAdapter adapter(events, quietOptions());

    std::mutex mutex;
    std::vector<AdapterState> states;
    adapter.setStateCallback([&](AdapterState state, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    });

    REQUIRE(adapter.getName() == "Mock");
    REQUIRE(adapter.start());
    REQUIRE(adapter.isRunning());

    auto snapshot = takeSnapshot(events);
    REQUIRE(snapshot.folders.size() == 3);
    REQUIRE(snapshot.chats.size() == 8);
    REQUIRE(snapshot.messages.size() == 8 * 5);

    for (const auto& folder : snapshot.folders) {
        REQUIRE(folder.id != ALL_CHATS_FOLDER_ID);
        REQUIRE_FALSE(folder.chatIds.empty());
    }
    for (const auto& chat : snapshot.chats) {
        REQUIRE(chat.lastActivity > 0);
        REQUIRE_FALSE(chat.lastPreview.empty());
    }

    adapter.stop();
    REQUIRE_FALSE(adapter.isRunning());
    REQUIRE(adapter.getState() == AdapterState::DISCONNECTED);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(states.front() == AdapterState::CONNECTING);
    REQUIRE(states.back() == AdapterState::DISCONNECTED);
}

TEST_CASE("Same seed gives the same data", "[mock_session]") {
    EventQueue first;
    EventQueue second;
    MockSessionAdapter a(first, quietOptions());
    MockSessionAdapter b(second, quietOptions());
    a.start();
    b.start();

    auto sa = takeSnapshot(first);
    auto sb = takeSnapshot(second);
    a.stop();
    b.stop();

    REQUIRE(sa.chats.size() == sb.chats.size());
    for (size_t i = 0; i < sa.chats.size(); ++i) {
        REQUIRE(sa.chats[i].id == sb.chats[i].id);
        REQUIRE(sa.chats[i].name == sb.chats[i].name);
        REQUIRE(sa.chats[i].unreadCount == sb.chats[i].unreadCount);
    }
    REQUIRE(sa.messages.size() == sb.messages.size());
    for (size_t i = 0; i < sa.messages.size(); ++i) {
        REQUIRE(sa.messages[i].message.id == sb.messages[i].message.id);
        REQUIRE(sa.messages[i].message.sender == sb.messages[i].message.sender);
        REQUIRE(sa.messages[i].message.text == sb.messages[i].message.text);
    }
}

TEST_CASE("Snapshot messages are chronological per chat", "[mock_session]") {
    EventQueue events;
    MockSessionAdapter adapter(events, quietOptions());
    adapter.start();
    auto snapshot = takeSnapshot(events);
    adapter.stop();

    std::map<ChatId, int64_t> last;
    for (const auto& upsert : snapshot.messages) {
        auto it = last.find(upsert.chatId);
        if (it != last.end()) {
            REQUIRE(upsert.message.timestamp > it->second);
        }
        last[upsert.chatId] = upsert.message.timestamp;
    }
}

TEST_CASE("fetchMore delivers older read messages", "[mock_session]") {
    EventQueue events;
    auto options = quietOptions();
    options.fetchBatch = 4;
    MockSessionAdapter adapter(events, options);
    adapter.start();
    auto snapshot = takeSnapshot(events);

    const ChatId chatId = snapshot.chats.front().id;
    MessageId oldest = 0;
    for (const auto& upsert : snapshot.messages) {
        if (upsert.chatId == chatId && (oldest == 0 || upsert.message.id < oldest)) {
            oldest = upsert.message.id;
        }
    }

    adapter.fetchMore(chatId, oldest);

    for (size_t i = 0; i < options.fetchBatch; ++i) {
        Event event;
        REQUIRE(events.pop_for(event, 2s));
        REQUIRE(std::holds_alternative<RemoteUpdate>(event));
        const auto& update = std::get<RemoteUpdate>(event);
        REQUIRE(std::holds_alternative<MessageUpsert>(update));
        const auto& upsert = std::get<MessageUpsert>(update);
        REQUIRE(upsert.chatId == chatId);
        REQUIRE(upsert.message.id == oldest - 1 - static_cast<MessageId>(i));
        REQUIRE(upsert.message.read);
    }
    adapter.stop();
}

TEST_CASE("markRead requests are counted", "[mock_session]") {
    EventQueue events;
    MockSessionAdapter adapter(events, quietOptions());
    adapter.start();
    takeSnapshot(events);

    adapter.markRead(100, 1004);
    adapter.markRead(101, 1004);
    REQUIRE(adapter.markReadRequests() == 2);
    adapter.stop();
}

TEST_CASE("failAfter ends the session with SessionFailure", "[mock_session]") {
    EventQueue events;
    MockSessionOptions options;
    options.interval = 5ms;
    options.historyPerChat = 3;
    options.failAfter = 3;
    MockSessionAdapter adapter(events, options);
    adapter.start();
    takeSnapshot(events);

    size_t updates = 0;
    bool failed = false;
    Event event;
    while (!failed && events.pop_for(event, 2s)) {
        if (std::holds_alternative<RemoteUpdate>(event)) {
            ++updates;
        } else if (auto* failure = std::get_if<SessionFailure>(&event)) {
            REQUIRE(failure->reason == "mock session dropped after 3 updates");
            failed = true;
        }
    }

    REQUIRE(failed);
    REQUIRE(updates >= 3);
    REQUIRE(adapter.updatesSent() == 3);
    REQUIRE(adapter.getState() == AdapterState::FAILED);
    REQUIRE_FALSE(adapter.isRunning());
    adapter.stop();
    REQUIRE(adapter.getState() == AdapterState::FAILED);
}

TEST_CASE("Adapter stops quietly when the queue is closed", "[mock_session]") {
    EventQueue events;
    events.stop();
    MockSessionAdapter adapter(events, quietOptions());
    adapter.start();
    adapter.stop();
    REQUIRE(adapter.updatesSent() == 0);
}

TEST_CASE("Test images are valid PGM", "[mock_session]") {
    for (int variant = 0; variant < 3; ++variant) {
        auto image = AsciiImageConverter::decode(MockSessionAdapter::makeTestImage(variant));
        REQUIRE(image.width == 64);
        REQUIRE(image.height == 32);
    }
    auto grid = AsciiImageConverter().convert(MockSessionAdapter::makeTestImage(0), 40);
    REQUIRE(grid.size() == 10);
    REQUIRE(grid[0].front() == '@');
    REQUIRE(grid[0].back() == '.');
}
