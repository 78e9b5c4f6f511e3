/**
 * @file render_scheduler.hpp
 * @brief 渲染调度器
 *
 * 在中心循环线程上，状态变化后从视图状态仓库生成完整的 RenderSnapshot，
 * 并以原子方式发布给终端前端。前端永远看不到半更新的状态。
 *
 * 图片转换交给后台线程池，按时间预算等待：
 * 超时则先显示占位符，转换完成后通过 ImageReady 事件回填缓存并重绘。
 */

#pragma once

#include "core/event.hpp"
#include "core/error.hpp"
#include "state/view_state_store.hpp"
#include "render/render_snapshot.hpp"
#include "render/image_converter.hpp"
#include "render/image_render_cache.hpp"
#include "base/thread_pool.hpp"
#include <memory>
#include <mutex>
#include <future>
#include <chrono>
#include <functional>
#include <unordered_map>

namespace paneltalk {

struct RenderOptions {
    std::chrono::milliseconds imageBudget{30};  ///< 单帧内等待图片转换的上限
    int imageWidth = 40;                        ///< 字符画列数
    std::string title = "paneltalk";
    std::string footer = "Tab: Switch panel | Enter: Select | Esc: Back | Ctrl+Q: Quit";
};

/**
 * @class RenderScheduler
 * @brief 脏标记驱动的快照生成与发布
 *
 * @par 线程模型
 * - render / onTick / onImageReady 只在中心循环线程调用
 * - latest() 可在任意线程调用（终端前端的绘制线程）
 */
class RenderScheduler {
public:
    /// 新快照发布后的通知（例如唤醒终端前端重绘）
    using Sink = std::function<void()>;

    /**
     * @param pool 图片转换线程池，为空时同步转换
     * @param events 转换完成后投递 ImageReady 的队列，可为空
     */
    RenderScheduler(const ViewStateStore& store,
                    ImageRenderCache& cache,
                    std::shared_ptr<const ImageConverter> converter,
                    ThreadPool* pool,
                    EventQueue* events,
                    ErrorCounters& errors,
                    RenderOptions options = RenderOptions());

    /**
     * @brief 仓库有变化或被标记为脏时生成并发布新快照
     * @param nowSec 当前 epoch 秒，用于相对时间
     * @return true 发布了新快照
     */
    bool render(int64_t nowSec);

    /// 节拍：推进动画帧并标记为脏
    void onTick();

    /// 后台转换完成：回填缓存并标记为脏
    void onImageReady(const ImageReady& ready);

    /**
     * @brief 消息行在消息面板中占用的终端行数
     *
     * 标题一行 + 正文各行 + 字符画行数 + 条目间空行。
     * 字符画行数由图片头估算，转换前后不变。
     */
    size_t messageHeight(const MessageEntity& message) const;

    /// 最近一次发布的快照（从未渲染时为空）
    std::shared_ptr<const RenderSnapshot> latest() const;

    void setSink(Sink sink);

    uint64_t renderCount() const { return renderCount_; }
    size_t pendingConversions() const { return pending_.size(); }

private:
    struct Pending {
        std::string payloadId;
        std::future<ImageGrid> future;
    };

    std::shared_ptr<RenderSnapshot> build(int64_t nowSec);
    PaneDescriptor describeLeft(int64_t nowSec) const;
    PaneDescriptor describeRight();

    DisplayRow folderRow(FolderId id) const;
    DisplayRow chatRow(ChatId id, int64_t nowSec) const;
    DisplayRow messageRow(ChatId chatId, const MessageEntity& message);

    /**
     * @brief 取字符画：缓存命中直接返回，否则提交转换并按预算等待
     * @param pending 输出，是否仍在转换
     */
    ImageGrid imageLines(const MessageKey& key, const ImageRef& image, bool& pending);

    std::string typingText(const std::string& user) const;

    void publish(std::shared_ptr<const RenderSnapshot> snapshot);

    const ViewStateStore& store_;
    ImageRenderCache& cache_;
    std::shared_ptr<const ImageConverter> converter_;
    ThreadPool* pool_;
    EventQueue* events_;
    ErrorCounters& errors_;
    RenderOptions options_;

    std::unordered_map<MessageKey, Pending, MessageKeyHash> pending_;

    uint64_t lastVersion_ = 0;
    bool dirty_ = true;
    uint64_t frame_ = 0;
    uint64_t renderCount_ = 0;
    std::chrono::steady_clock::time_point frameDeadline_;

    mutable std::mutex mutex_;
    std::shared_ptr<const RenderSnapshot> latest_;
    Sink sink_;
};

/// 相对时间："now" / "5m" / "3h" / "2d"
std::string formatAge(int64_t nowSec, int64_t thenSec);

/// 本地时间 "YYYY-mm-dd HH:MM:SS"
std::string formatTimestamp(int64_t epochSec);

} // namespace paneltalk
