/**
 * @file image_render_cache.hpp
 * @brief 字符画缓存
 */

#pragma once

#include "model/entities.hpp"
#include "render/image_converter.hpp"
#include <list>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace paneltalk {

/**
 * @class ImageRenderCache
 * @brief 按 (会话, 消息) 缓存转换后的字符画，LRU 淘汰
 *
 * - 条目记录来源图片的 payloadId，图片被替换时旧条目视为未命中
 * - 当前可见的条目不会被淘汰，容量不足时暂时超出上限
 *
 * 只在中心循环线程使用，不加锁。
 */
class ImageRenderCache {
public:
    explicit ImageRenderCache(size_t capacity);

    /**
     * @brief 查找缓存
     * @return 命中时返回字符画并刷新 LRU；payloadId 不一致时删除旧条目并返回空
     */
    std::optional<ImageGrid> get(const MessageKey& key, const std::string& payloadId);

    void put(const MessageKey& key, const std::string& payloadId, ImageGrid grid);

    /// 更新可见集合，随后按容量淘汰
    void setVisible(const std::vector<MessageKey>& visible);

    bool contains(const MessageKey& key) const { return entries_.count(key) != 0; }
    void erase(const MessageKey& key);

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

private:
    void evict();

    struct Entry {
        std::string payloadId;
        ImageGrid grid;
        std::list<MessageKey>::iterator pos;
    };

    size_t capacity_;
    std::list<MessageKey> lru_;     ///< 头部为最近使用
    std::unordered_map<MessageKey, Entry, MessageKeyHash> entries_;
    std::unordered_set<MessageKey, MessageKeyHash> visible_;
};

} // namespace paneltalk
