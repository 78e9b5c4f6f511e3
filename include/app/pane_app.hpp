/**
 * @file pane_app.hpp
 * @brief 中心事件循环
 *
 * 所有异步来源只向 EventQueue 投递事件：
 * - 终端前端：UserInput / Resize
 * - 会话适配器：InitialSnapshot / RemoteUpdate / SessionFailure
 * - 定时线程（时间轮）：Tick
 * - 图片转换线程池：ImageReady
 *
 * 中心循环逐个取出事件，经对账器或输入调度器修改视图状态仓库，
 * 然后由渲染调度器生成快照。仓库只在这一个线程上被修改。
 */

#pragma once

#include "app/app_options.hpp"
#include "core/event.hpp"
#include "core/error.hpp"
#include "state/view_state_store.hpp"
#include "state/reconciler.hpp"
#include "state/input_dispatcher.hpp"
#include "render/render_scheduler.hpp"
#include "render/image_render_cache.hpp"
#include "session/session_adapter.hpp"
#include "base/thread_pool.hpp"
#include "base/timing_wheel.hpp"
#include <memory>
#include <thread>
#include <atomic>
#include <functional>

namespace paneltalk {

/// 进程退出码
constexpr int EXIT_OK = 0;
constexpr int EXIT_STARTUP_ERROR = 1;
constexpr int EXIT_SESSION_FAILURE = 2;

/**
 * @brief 中心循环统计
 */
struct LoopStats {
    uint64_t events = 0;
    uint64_t userInputs = 0;
    uint64_t remoteUpdates = 0;
    uint64_t ticks = 0;
    uint64_t actionsSent = 0;
};

/**
 * @class PaneApp
 * @brief 组装仓库、对账器、调度器与会话适配器，运行中心循环
 *
 * @par 使用示例
 * @code
 * PaneApp app(options, [&](EventQueue& q) {
 *     return std::make_unique<MockSessionAdapter>(q, options.mock);
 * });
 * int code = app.run();   // 阻塞直到 Ctrl+Q 或会话失败
 * @endcode
 */
class PaneApp {
public:
    using AdapterFactory = std::function<std::unique_ptr<SessionAdapter>(EventQueue&)>;
    using ExitHandler = std::function<void(int exitCode)>;

    PaneApp(AppOptions options, AdapterFactory factory);
    ~PaneApp();

    PaneApp(const PaneApp&) = delete;
    PaneApp& operator=(const PaneApp&) = delete;

    /**
     * @brief 启动适配器与定时线程，运行中心循环（阻塞）
     * @return 退出码：EXIT_OK（用户退出）、EXIT_SESSION_FAILURE（会话失败或无法启动）
     */
    int run();

    /**
     * @brief 处理单个事件
     * @return false 循环应当结束
     *
     * 可在没有启动 run() 的情况下直接调用（测试用）。
     */
    bool process(const Event& event);

    /// 循环结束时回调（例如让终端前端退出）
    void setExitHandler(ExitHandler handler) { exitHandler_ = std::move(handler); }

    EventQueue& events() { return events_; }
    RenderScheduler& renderer() { return *renderer_; }
    const ViewStateStore& store() const { return store_; }
    const ErrorCounters& errors() const { return errors_; }
    const LoopStats& stats() const { return stats_; }
    SessionAdapter* adapter() { return adapter_.get(); }
    int exitCode() const { return exitCode_; }

private:
    void forward(const std::vector<OutboundAction>& actions);
    void startTicker();
    void shutdown();

    static int64_t steadyMs();
    static int64_t wallSeconds();

    AppOptions options_;
    ErrorCounters errors_;
    EventQueue events_;

    ViewStateStore store_;
    Reconciler reconciler_;
    InputDispatcher dispatcher_;

    ImageRenderCache cache_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<RenderScheduler> renderer_;

    std::unique_ptr<SessionAdapter> adapter_;

    TimingWheel wheel_;
    TimerTaskId tickTask_ = INVALID_TIMER_ID;
    std::atomic<bool> tickerRunning_{false};
    std::thread ticker_;

    LoopStats stats_;
    int exitCode_ = EXIT_OK;
    ExitHandler exitHandler_;
};

} // namespace paneltalk
