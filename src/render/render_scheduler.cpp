/**
 * @file render_scheduler.cpp
 * @brief RenderScheduler 实现
 */

#include "render/render_scheduler.hpp"
#include "base/logger.hpp"
#include <ctime>
#include <sstream>
#include <algorithm>

namespace paneltalk {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string unreadPrefix(int unread) {
    return unread > 0 ? "(" + std::to_string(unread) + ") " : std::string();
}

} // anonymous namespace

std::string formatAge(int64_t nowSec, int64_t thenSec) {
    if (thenSec <= 0) {
        return "";
    }
    const int64_t age = std::max<int64_t>(0, nowSec - thenSec);
    if (age < 60) return "now";
    if (age < 3600) return std::to_string(age / 60) + "m";
    if (age < 86400) return std::to_string(age / 3600) + "h";
    return std::to_string(age / 86400) + "d";
}

std::string formatTimestamp(int64_t epochSec) {
    const std::time_t t = static_cast<std::time_t>(epochSec);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

RenderScheduler::RenderScheduler(const ViewStateStore& store,
                                 ImageRenderCache& cache,
                                 std::shared_ptr<const ImageConverter> converter,
                                 ThreadPool* pool,
                                 EventQueue* events,
                                 ErrorCounters& errors,
                                 RenderOptions options)
    : store_(store)
    , cache_(cache)
    , converter_(std::move(converter))
    , pool_(pool)
    , events_(events)
    , errors_(errors)
    , options_(std::move(options)) {}

bool RenderScheduler::render(int64_t nowSec) {
    if (!dirty_ && store_.version() == lastVersion_) {
        return false;
    }
    lastVersion_ = store_.version();
    dirty_ = false;

    publish(build(nowSec));
    ++renderCount_;
    return true;
}

void RenderScheduler::onTick() {
    ++frame_;
    dirty_ = true;
}

void RenderScheduler::onImageReady(const ImageReady& ready) {
    auto it = pending_.find(ready.key);
    if (it != pending_.end() && it->second.payloadId == ready.payloadId) {
        pending_.erase(it);
    }
    // 图片已被替换时丢弃过期结果
    const auto* m = store_.findMessage(ready.key.chatId, ready.key.messageId);
    if (!m || !m->image || m->image->payloadId != ready.payloadId) {
        return;
    }
    if (cache_.get(ready.key, ready.payloadId)) {
        return;
    }
    cache_.put(ready.key, ready.payloadId, ready.grid);
    dirty_ = true;
}

size_t RenderScheduler::messageHeight(const MessageEntity& message) const {
    // 标题行与条目后的空行
    size_t lines = 2;
    if (message.deleted) {
        return lines + 1;
    }
    lines += splitLines(message.text).size();
    if (message.image) {
        lines += message.image->bytes && converter_
                     ? converter_->measure(*message.image->bytes, options_.imageWidth)
                     : 1;
    }
    return lines;
}

std::shared_ptr<const RenderSnapshot> RenderScheduler::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

void RenderScheduler::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void RenderScheduler::publish(std::shared_ptr<const RenderSnapshot> snapshot) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(snapshot);
        sink = sink_;
    }
    if (sink) {
        sink();
    }
}

// =============================================================================
// 快照生成
// =============================================================================

std::shared_ptr<RenderSnapshot> RenderScheduler::build(int64_t nowSec) {
    // 整帧共用一个图片等待预算
    frameDeadline_ = std::chrono::steady_clock::now() + options_.imageBudget;

    auto snapshot = std::make_shared<RenderSnapshot>();
    snapshot->storeVersion = store_.version();
    snapshot->frame = frame_;
    snapshot->left = describeLeft(nowSec);
    snapshot->right = describeRight();

    std::string header = options_.title;
    const auto& left = store_.panel(Pane::Left);
    if (left.content.kind == ContentKind::ChatList) {
        if (auto folder = store_.folderInfo(left.content.id)) {
            header += " > " + folder->name;
        }
    }
    const auto& right = store_.panel(Pane::Right);
    if (right.content.kind == ContentKind::MessageList) {
        if (const auto* chat = store_.findChat(right.content.id)) {
            header += " > " + chat->name;
        }
    }
    snapshot->header = header;
    snapshot->status = store_.status();
    snapshot->footer = options_.footer;
    return snapshot;
}

PaneDescriptor RenderScheduler::describeLeft(int64_t nowSec) const {
    const auto& ps = store_.panel(Pane::Left);
    const auto seq = store_.sequence(Pane::Left);

    PaneDescriptor pane;
    pane.cursor = ps.cursor;
    pane.scrollOffset = ps.scrollOffset;
    pane.total = seq.size();
    pane.focused = ps.focused;

    if (ps.content.kind == ContentKind::ChatList) {
        auto folder = store_.folderInfo(ps.content.id);
        pane.title = folder ? folder->name : "Chats";
        pane.emptyText = "No chats";
    } else {
        pane.title = "Folders";
        pane.emptyText = "No folders";
    }

    const size_t end = std::min(seq.size(), ps.scrollOffset + store_.visibleCount(Pane::Left));
    for (size_t i = ps.scrollOffset; i < end; ++i) {
        DisplayRow row = ps.content.kind == ContentKind::ChatList ? chatRow(seq[i], nowSec)
                                                                  : folderRow(seq[i]);
        row.selected = ps.cursor && *ps.cursor == i;
        pane.rows.push_back(std::move(row));
    }
    return pane;
}

PaneDescriptor RenderScheduler::describeRight() {
    const auto& ps = store_.panel(Pane::Right);

    PaneDescriptor pane;
    pane.cursor = ps.cursor;
    pane.scrollOffset = ps.scrollOffset;
    pane.focused = ps.focused;

    if (ps.content.kind != ContentKind::MessageList) {
        pane.title = "Messages";
        pane.emptyText = "Select a chat";
        cache_.setVisible({});
        return pane;
    }

    const ChatId chatId = ps.content.id;
    const auto* chat = store_.findChat(chatId);
    pane.title = chat ? chat->name : "Chat " + std::to_string(chatId);
    if (chat && !chat->typingUser.empty()) {
        pane.title += "  " + typingText(chat->typingUser);
    }
    pane.emptyText = "No messages";

    const auto seq = store_.sequence(Pane::Right);
    pane.total = seq.size();
    const size_t end = std::min(seq.size(), ps.scrollOffset + store_.visibleCount(Pane::Right));

    // 先固定可见集合，避免本帧需要的字符画被淘汰
    std::vector<MessageKey> visible;
    for (size_t i = ps.scrollOffset; i < end; ++i) {
        visible.push_back(MessageKey{chatId, seq[i]});
    }
    cache_.setVisible(visible);

    for (size_t i = ps.scrollOffset; i < end; ++i) {
        const auto* m = store_.findMessage(chatId, seq[i]);
        if (!m) {
            continue;
        }
        DisplayRow row = messageRow(chatId, *m);
        row.selected = ps.cursor && *ps.cursor == i;
        pane.rows.push_back(std::move(row));
    }
    return pane;
}

DisplayRow RenderScheduler::folderRow(FolderId id) const {
    DisplayRow row;
    row.kind = RowKind::Folder;
    row.id = id;
    auto folder = store_.folderInfo(id);
    if (!folder) {
        row.lines.push_back("Folder " + std::to_string(id));
        return row;
    }
    row.unread = folder->unreadCount > 0;
    row.lines.push_back(unreadPrefix(folder->unreadCount) + folder->name +
                        " [" + std::to_string(folder->chatIds.size()) + "]");
    return row;
}

DisplayRow RenderScheduler::chatRow(ChatId id, int64_t nowSec) const {
    DisplayRow row;
    row.kind = RowKind::Chat;
    row.id = id;
    const auto* chat = store_.findChat(id);
    if (!chat) {
        row.lines.push_back("Chat " + std::to_string(id));
        return row;
    }
    row.unread = chat->unreadCount > 0;

    std::string title = unreadPrefix(chat->unreadCount) + chat->name;
    const std::string age = formatAge(nowSec, chat->lastActivity);
    if (!age.empty()) {
        title += "  " + age;
    }
    row.lines.push_back(title);
    row.lines.push_back(chat->typingUser.empty() ? chat->lastPreview : typingText(chat->typingUser));
    return row;
}

DisplayRow RenderScheduler::messageRow(ChatId chatId, const MessageEntity& message) {
    DisplayRow row;
    row.kind = RowKind::Message;
    row.id = message.id;
    row.unread = !message.read;
    row.deleted = message.deleted;

    std::string header = message.sender + " [" + formatTimestamp(message.timestamp) + "]";
    if (message.edited && !message.deleted) {
        header += " (edited)";
    }
    row.lines.push_back(header);

    if (message.deleted) {
        row.lines.push_back("[message deleted]");
        return row;
    }

    for (auto& line : splitLines(message.text)) {
        row.lines.push_back(std::move(line));
    }
    if (message.image) {
        row.image = true;
        bool pending = false;
        for (auto& line : imageLines(MessageKey{chatId, message.id}, *message.image, pending)) {
            row.lines.push_back(std::move(line));
        }
        row.pending = pending;
    }
    return row;
}

ImageGrid RenderScheduler::imageLines(const MessageKey& key, const ImageRef& image, bool& pending) {
    pending = false;
    if (auto grid = cache_.get(key, image.payloadId)) {
        return *grid;
    }
    if (!image.bytes || !converter_) {
        return {AsciiImageConverter::UNSUPPORTED};
    }

    auto it = pending_.find(key);
    if (it != pending_.end() && it->second.payloadId != image.payloadId) {
        // 图片被替换，放弃旧的转换结果
        pending_.erase(it);
        it = pending_.end();
    }

    const bool submitted = it == pending_.end();
    if (submitted) {
        auto converter = converter_;
        auto bytes = image.bytes;
        const int width = options_.imageWidth;
        const std::string payloadId = image.payloadId;

        if (!pool_) {
            ImageGrid grid = converter->convert(*bytes, width);
            cache_.put(key, payloadId, grid);
            return grid;
        }

        EventQueue* events = events_;
        std::future<ImageGrid> future;
        try {
            future = pool_->enqueue([converter, bytes, width, key, payloadId, events] {
                ImageGrid grid;
                try {
                    grid = converter->convert(*bytes, width);
                } catch (const std::exception& e) {
                    grid = {std::string("[Error converting image: ") + e.what() + "]"};
                }
                if (events) {
                    events->enqueue(ImageReady{key, payloadId, grid});
                }
                return grid;
            });
        } catch (const std::runtime_error& e) {
            LOG() << "[RenderScheduler] Image conversion not scheduled: " << e.what();
            pending = true;
            return {"[image]"};
        }
        it = pending_.emplace(key, Pending{payloadId, std::move(future)}).first;
    }

    // 只在首次提交时等待本帧剩余的预算，之后的帧只检查是否完成
    auto& future = it->second.future;
    auto budget = std::chrono::steady_clock::duration::zero();
    if (submitted) {
        budget = std::max(budget, frameDeadline_ - std::chrono::steady_clock::now());
    }
    if (future.wait_for(budget) == std::future_status::ready) {
        ImageGrid grid = future.get();
        cache_.put(key, it->second.payloadId, grid);
        pending_.erase(it);
        return grid;
    }

    if (submitted) {
        errors_.record(ErrorKind::RenderBudgetExceeded);
        LOG() << "[RenderScheduler] " << toString(ErrorKind::RenderBudgetExceeded)
              << ": image " << key.chatId << "/" << key.messageId << " still converting";
    }
    pending = true;
    return {"[image: rendering...]"};
}

std::string RenderScheduler::typingText(const std::string& user) const {
    return user + " is typing" + std::string(frame_ % 4, '.');
}

} // namespace paneltalk
