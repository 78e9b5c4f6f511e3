/**
 * @file app_options.cpp
 * @brief AppOptions 实现
 */

#include "app/app_options.hpp"
#include <stdexcept>

namespace paneltalk {

namespace {

int positive(Config& config, const char* section, const char* key, int def) {
    const int value = config.get_int(section, key, def);
    if (value <= 0) {
        throw std::invalid_argument(std::string("[") + section + "] " + key +
                                    " must be positive, got " + std::to_string(value));
    }
    return value;
}

int nonNegative(Config& config, const char* section, const char* key, int def) {
    const int value = config.get_int(section, key, def);
    if (value < 0) {
        throw std::invalid_argument(std::string("[") + section + "] " + key +
                                    " must not be negative, got " + std::to_string(value));
    }
    return value;
}

} // anonymous namespace

AppOptions AppOptions::fromConfig(Config& config) {
    AppOptions o;

    o.tick = std::chrono::milliseconds(positive(config, "render", "tick_ms", 250));
    o.render.imageBudget = std::chrono::milliseconds(nonNegative(config, "render", "image_budget_ms", 30));
    o.render.imageWidth = positive(config, "render", "image_width", 40);
    o.imageCacheCapacity = static_cast<size_t>(positive(config, "render", "image_cache_capacity", 64));
    o.imageWorkers = static_cast<size_t>(positive(config, "render", "image_workers", 1));

    o.store.maxMessages = static_cast<size_t>(positive(config, "messages", "max_messages", 100));
    o.store.followTail = config.get_bool("messages", "follow_tail", true);
    o.reconciler.fetchMoreThreshold =
        static_cast<size_t>(nonNegative(config, "messages", "fetch_more_threshold", 3));

    o.store.showAllChats = config.get_bool("folders", "show_all_chats", true);
    o.store.allChatsTitle = config.get("folders", "all_chats_title", "All Chats");

    o.reconciler.typingTimeoutMs = positive(config, "typing", "timeout_ms", 5000);

    o.adapter = config.get("session", "adapter", "mock");
    if (o.adapter != "mock") {
        throw std::invalid_argument("unknown session adapter: " + o.adapter);
    }
    o.mock.interval = std::chrono::milliseconds(positive(config, "session", "interval_ms", 1500));
    o.mock.seed = static_cast<uint32_t>(nonNegative(config, "session", "seed", 42));
    o.mock.failAfter = nonNegative(config, "session", "fail_after", 0);

    o.logFile = config.get("log", "file", "");
    return o;
}

} // namespace paneltalk
