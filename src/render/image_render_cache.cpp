/**
 * @file image_render_cache.cpp
 * @brief ImageRenderCache 实现
 */

#include "render/image_render_cache.hpp"
#include <algorithm>

namespace paneltalk {

ImageRenderCache::ImageRenderCache(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

std::optional<ImageGrid> ImageRenderCache::get(const MessageKey& key, const std::string& payloadId) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.payloadId != payloadId) {
        erase(key);
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second.pos);
    return it->second.grid;
}

void ImageRenderCache::put(const MessageKey& key, const std::string& payloadId, ImageGrid grid) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.payloadId = payloadId;
        it->second.grid = std::move(grid);
        lru_.splice(lru_.begin(), lru_, it->second.pos);
    } else {
        lru_.push_front(key);
        entries_.emplace(key, Entry{payloadId, std::move(grid), lru_.begin()});
    }
    evict();
}

void ImageRenderCache::setVisible(const std::vector<MessageKey>& visible) {
    visible_.clear();
    visible_.insert(visible.begin(), visible.end());
    evict();
}

void ImageRenderCache::erase(const MessageKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    lru_.erase(it->second.pos);
    entries_.erase(it);
}

void ImageRenderCache::evict() {
    auto it = lru_.end();
    while (entries_.size() > capacity_ && it != lru_.begin()) {
        --it;
        if (visible_.count(*it) != 0) {
            continue;
        }
        auto victim = it;
        ++it;
        entries_.erase(*victim);
        lru_.erase(victim);
    }
}

} // namespace paneltalk
