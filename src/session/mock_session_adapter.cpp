/**
 * @file mock_session_adapter.cpp
 * @brief 模拟会话适配器实现
 */

#include "session/mock_session_adapter.hpp"
#include "base/logger.hpp"
#include <cmath>
#include <algorithm>

namespace paneltalk {

namespace {

const char* const SENDERS[] = {"Alice", "Bob", "Carol", "Dave", "Eve", "Mallory"};

const char* const PHRASES[] = {
    "Hello!",
    "Are we still on for tomorrow?",
    "I pushed the fix, please take a look",
    "lol",
    "Can you send me the report?",
    "Meeting moved to 3pm",
    "Thanks, that works for me",
    "Did anyone see the release notes?",
    "On my way",
    "Let's discuss this after lunch\nI have a few notes",
};

struct ChatSeed {
    const char* name;
    FolderId folder;
};

const ChatSeed CHATS[] = {
    {"Family", 1},
    {"Alice", 1},
    {"Bob", 1},
    {"Backend Team", 2},
    {"Release Planning", 2},
    {"On-call", 2},
    {"Tech News", 3},
    {"Photography", 3},
};

} // anonymous namespace

MockSessionAdapter::MockSessionAdapter(EventQueue& events, MockSessionOptions options)
    : SessionAdapter(events)
    , options_(options)
    , rng_(options.seed)
{
}

MockSessionAdapter::~MockSessionAdapter() {
    stop();
}

bool MockSessionAdapter::start() {
    if (running_.load()) {
        return true;
    }

    notifyState(AdapterState::CONNECTING, "Connecting to mock session...");
    running_.store(true);
    workerThread_ = std::thread(&MockSessionAdapter::run, this);

    LOG() << "[MockSessionAdapter] Started, seed=" << options_.seed
          << " interval=" << options_.interval.count() << "ms";
    return true;
}

void MockSessionAdapter::stop() {
    if (!running_.exchange(false)) {
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        return;
    }

    cv_.notify_all();
    if (workerThread_.joinable()) {
        workerThread_.join();
    }

    if (state_.load() != AdapterState::FAILED) {
        state_.store(AdapterState::DISCONNECTED);
        notifyState(AdapterState::DISCONNECTED, "Mock session stopped");
    }
    LOG() << "[MockSessionAdapter] Stopped after " << updatesSent_.load() << " updates";
}

void MockSessionAdapter::fetchMore(ChatId chatId, MessageId beforeMessageId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(FetchMore{chatId, beforeMessageId});
    }
    cv_.notify_all();
}

void MockSessionAdapter::markRead(ChatId chatId, MessageId messageId) {
    markReadRequests_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(MarkRead{chatId, messageId});
    }
    cv_.notify_all();
}

void MockSessionAdapter::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateCallback_ = std::move(callback);
}

void MockSessionAdapter::notifyState(AdapterState state, const std::string& message) {
    state_.store(state);
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = stateCallback_;
    }
    if (callback) {
        callback(state, message);
    }
}

int64_t MockSessionAdapter::nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// 工作线程
// =============================================================================

void MockSessionAdapter::run() {
    if (!pushEvent(buildSnapshot())) {
        return;
    }
    notifyState(AdapterState::READY, "Mock session ready");

    while (running_.load()) {
        bool woken = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            woken = cv_.wait_for(lock, options_.interval, [this] {
                return !running_.load() || !requests_.empty();
            });
        }
        if (!running_.load()) {
            break;
        }

        handleRequests();

        // 被请求唤醒时不推送增量，保持推送间隔
        if (woken) {
            continue;
        }

        if (options_.failAfter > 0 && updatesSent_.load() >= static_cast<size_t>(options_.failAfter)) {
            const std::string reason = "mock session dropped after " +
                                       std::to_string(updatesSent_.load()) + " updates";
            LOG() << "[MockSessionAdapter] " << reason;
            running_.store(false);
            notifyState(AdapterState::FAILED, reason);
            pushEvent(SessionFailure{reason});
            break;
        }

        if (!pushEvent(nextUpdate())) {
            break;
        }
        updatesSent_.fetch_add(1);
    }
}

void MockSessionAdapter::handleRequests() {
    std::deque<OutboundAction> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(requests_);
    }

    for (const auto& request : pending) {
        if (auto* read = std::get_if<MarkRead>(&request)) {
            auto it = chats_.find(read->chatId);
            if (it == chats_.end()) {
                continue;
            }
            for (auto& [id, m] : it->second.messages) {
                if (id <= read->messageId) {
                    m.read = true;
                }
            }
            it->second.chat.unreadCount = 0;
            continue;
        }

        const auto& fetch = std::get<FetchMore>(request);
        auto it = chats_.find(fetch.chatId);
        if (it == chats_.end()) {
            continue;
        }
        ChatModel& model = it->second;
        size_t produced = 0;
        while (produced < options_.fetchBatch && model.oldestId > 1) {
            --model.oldestId;
            model.oldestTimestamp -= 60 + static_cast<int64_t>(rng_() % 600);
            MessageEntity m = makeMessage(model, model.oldestId, model.oldestTimestamp, true);
            m.read = true;
            model.messages[m.id] = m;
            model.live.insert(model.live.begin(), m.id);
            pushEvent(RemoteUpdate{MessageUpsert{model.chat.id, m}});
            ++produced;
        }
        LOG() << "[MockSessionAdapter] fetchMore chat=" << fetch.chatId
              << " before=" << fetch.beforeMessageId << " -> " << produced << " messages";
    }
}

// =============================================================================
// 数据生成
// =============================================================================

InitialSnapshot MockSessionAdapter::buildSnapshot() {
    InitialSnapshot snapshot;
    const int64_t now = nowSeconds();

    folders_[1] = {"Personal", 1};
    folders_[2] = {"Work", 2};
    folders_[3] = {"Channels", 3};

    ChatId chatId = 100;
    for (const auto& seed : CHATS) {
        ChatModel model;
        model.chat.id = chatId;
        model.chat.name = seed.name;
        model.folder = seed.folder;

        const int unread = static_cast<int>(rng_() % 4);
        const size_t history = std::max<size_t>(options_.historyPerChat, 1);
        // 最新消息 ID 留出向前拉取历史的空间
        const MessageId first = 1000;
        int64_t ts = now - static_cast<int64_t>(history) * 300 - static_cast<int64_t>(rng_() % 3600);
        model.oldestId = first;
        model.oldestTimestamp = ts;

        for (size_t i = 0; i < history; ++i) {
            const MessageId id = first + static_cast<MessageId>(i);
            MessageEntity m = makeMessage(model, id, ts, true);
            m.read = i + static_cast<size_t>(unread) < history;
            model.messages[id] = m;
            model.live.push_back(id);
            snapshot.messages.push_back(MessageUpsert{chatId, m});
            ts += 60 + static_cast<int64_t>(rng_() % 300);
        }
        model.nextId = first + static_cast<MessageId>(history);

        const auto& last = model.messages.rbegin()->second;
        model.chat.lastActivity = last.timestamp;
        model.chat.lastPreview = last.sender + ": " + (last.text.empty() ? "[image]" : last.text);
        model.chat.unreadCount = std::min<int>(unread, static_cast<int>(history));

        snapshot.chats.push_back(model.chat);
        chats_.emplace(chatId, std::move(model));
        ++chatId;
    }
    nextChatId_ = chatId;

    for (const auto& [id, info] : folders_) {
        snapshot.folders.push_back(folderOf(id));
    }
    return snapshot;
}

FolderEntity MockSessionAdapter::folderOf(FolderId id) const {
    FolderEntity folder;
    folder.id = id;
    auto it = folders_.find(id);
    if (it != folders_.end()) {
        folder.name = it->second.first;
        folder.position = it->second.second;
    }
    for (const auto& [chatId, model] : chats_) {
        if (model.folder == id) {
            folder.chatIds.push_back(chatId);
            folder.unreadCount += model.chat.unreadCount;
        }
    }
    return folder;
}

MockSessionAdapter::ChatModel& MockSessionAdapter::pickChat() {
    auto it = chats_.begin();
    std::advance(it, static_cast<long>(rng_() % chats_.size()));
    return it->second;
}

MessageEntity MockSessionAdapter::makeMessage(ChatModel& model, MessageId id, int64_t timestamp, bool incoming) {
    MessageEntity m;
    m.id = id;
    m.timestamp = timestamp;
    m.sender = incoming ? SENDERS[rng_() % (sizeof(SENDERS) / sizeof(SENDERS[0]))] : "Me";
    if (rng_() % 10 == 0) {
        m.image = makeImageRef(model.chat.id, id, ++imageRevision_);
    } else {
        m.text = PHRASES[rng_() % (sizeof(PHRASES) / sizeof(PHRASES[0]))];
    }
    return m;
}

ImageRef MockSessionAdapter::makeImageRef(ChatId chatId, MessageId id, int revision) {
    ImageRef ref;
    ref.payloadId = "img-" + std::to_string(chatId) + "-" + std::to_string(id) + "-" + std::to_string(revision);
    ref.bytes = std::make_shared<const std::vector<uint8_t>>(makeTestImage(revision % 3));
    return ref;
}

RemoteUpdate MockSessionAdapter::nextUpdate() {
    const int64_t now = nowSeconds();
    const unsigned roll = rng_() % 100;
    ChatModel& model = pickChat();
    const ChatId chatId = model.chat.id;

    // 正在输入的会话优先收到新消息
    if (model.typing) {
        model.typing = false;
        if (roll < 50) {
            return TypingChanged{chatId, "", false};
        }
    }

    if (roll < 50) {
        const MessageId id = model.nextId++;
        MessageEntity m = makeMessage(model, id, std::max(now, model.chat.lastActivity), rng_() % 5 != 0);
        if (m.sender == "Me") {
            m.read = true;
        }
        model.messages[id] = m;
        model.live.push_back(id);
        model.chat.lastActivity = m.timestamp;
        return MessageUpsert{chatId, m};
    }

    if (roll < 60 && !model.live.empty()) {
        const MessageId id = model.live[rng_() % model.live.size()];
        MessageEntity m = model.messages[id];
        if (m.image) {
            m.image = makeImageRef(chatId, id, ++imageRevision_);
        } else {
            m.text += " (upd)";
        }
        m.edited = true;
        model.messages[id] = m;
        return MessageUpsert{chatId, m};
    }

    if (roll < 66 && model.live.size() > 1) {
        const size_t idx = rng_() % model.live.size();
        const MessageId id = model.live[idx];
        model.live.erase(model.live.begin() + static_cast<long>(idx));
        model.messages.erase(id);
        return MessageDeleted{chatId, id};
    }

    if (roll < 86) {
        model.typing = true;
        return TypingChanged{chatId, SENDERS[rng_() % (sizeof(SENDERS) / sizeof(SENDERS[0]))], true};
    }

    if (roll < 90) {
        model.chat.name = model.chat.name.substr(0, model.chat.name.find(" #")) +
                          " #" + std::to_string(rng_() % 100);
        return ChatChanged{model.chat};
    }

    if (roll < 95) {
        // 在文件夹之间移动会话
        const FolderId from = model.folder;
        model.folder = 1 + static_cast<FolderId>(rng_() % folders_.size());
        if (model.folder == from) {
            model.folder = from % static_cast<FolderId>(folders_.size()) + 1;
        }
        pushEvent(RemoteUpdate{FolderChanged{folderOf(from)}});
        return FolderChanged{folderOf(model.folder)};
    }

    // 新会话
    ChatModel fresh;
    fresh.chat.id = nextChatId_++;
    fresh.chat.name = "New chat " + std::to_string(fresh.chat.id);
    fresh.chat.lastActivity = now;
    fresh.folder = 1;
    fresh.nextId = 1;
    fresh.oldestId = 1;
    fresh.oldestTimestamp = now;
    pushEvent(RemoteUpdate{ChatChanged{fresh.chat}});
    chats_.emplace(fresh.chat.id, std::move(fresh));
    return FolderChanged{folderOf(1)};
}

std::vector<uint8_t> MockSessionAdapter::makeTestImage(int variant, int width, int height) {
    const std::string header = "P5\n" + std::to_string(width) + " " + std::to_string(height) + "\n255\n";
    std::vector<uint8_t> bytes(header.begin(), header.end());
    bytes.reserve(bytes.size() + static_cast<size_t>(width * height));

    const double cx = width / 2.0;
    const double cy = height / 2.0;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t v = 0;
            switch (variant) {
                case 0:
                    v = static_cast<uint8_t>(x * 255 / std::max(width - 1, 1));
                    break;
                case 1: {
                    const double d = std::hypot(x - cx, (y - cy) * 2.0);
                    v = static_cast<uint8_t>(static_cast<int>(d * 16) % 256);
                    break;
                }
                default:
                    v = ((x / 8 + y / 4) % 2 == 0) ? 0 : 255;
                    break;
            }
            bytes.push_back(v);
        }
    }
    return bytes;
}

} // namespace paneltalk
