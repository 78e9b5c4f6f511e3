/**
 * @file app_options.hpp
 * @brief 应用配置
 *
 * 从 INI 配置（Config 单例）读取，缺省项使用默认值：
 *
 * @code
 * [render]
 * tick_ms = 250
 * image_budget_ms = 30
 * image_width = 40
 * image_cache_capacity = 64
 * image_workers = 1
 *
 * [messages]
 * max_messages = 100
 * fetch_more_threshold = 3
 * follow_tail = true
 *
 * [folders]
 * show_all_chats = true
 * all_chats_title = All Chats
 *
 * [typing]
 * timeout_ms = 5000
 *
 * [session]
 * adapter = mock
 * interval_ms = 1500
 * seed = 42
 * fail_after = 0
 *
 * [log]
 * file = paneltalk.log
 * @endcode
 */

#pragma once

#include "base/config.hpp"
#include "state/view_state_store.hpp"
#include "state/reconciler.hpp"
#include "render/render_scheduler.hpp"
#include "session/mock_session_adapter.hpp"
#include <chrono>
#include <string>

namespace paneltalk {

struct AppOptions {
    StoreOptions store;
    ReconcilerOptions reconciler;
    RenderOptions render;

    std::chrono::milliseconds tick{250};    ///< 节拍间隔（动画、输入状态过期）
    size_t imageCacheCapacity = 64;
    size_t imageWorkers = 1;

    std::string adapter = "mock";
    MockSessionOptions mock;

    std::string logFile;                    ///< 为空时 TUI 运行期间关闭日志

    /**
     * @brief 从配置读取
     * @throws std::invalid_argument 取值不合法（如 tick_ms <= 0、未知的 adapter）
     */
    static AppOptions fromConfig(Config& config);
};

} // namespace paneltalk
