/**
 * @file app.hpp
 * @brief TUI 主应用
 */

#pragma once

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include "app/pane_app.hpp"
#include <memory>
#include <utility>

namespace paneltalk::client::tui {

/**
 * @class TuiApp
 * @brief 双面板终端前端
 *
 * 只做两件事：
 * - 把终端按键与尺寸变化翻译为事件投递给中心循环
 * - 读取渲染调度器发布的最新快照并绘制
 *
 * 布局：
 * - 顶部：标题栏（当前文件夹 / 会话）
 * - 左侧：文件夹或会话列表
 * - 右侧：消息列表
 * - 底部：状态信息 + 按键提示
 */
class TuiApp {
public:
    explicit TuiApp(PaneApp& app);

    /**
     * @brief 运行 TUI（阻塞）
     */
    void run();

    /**
     * @brief 请求退出（可从任意线程调用）
     */
    void requestExit();

    /**
     * @brief 通知重绘（可从任意线程调用）
     */
    void refresh();

    /**
     * @brief 终端事件到按键的映射，无法识别时为 Key::Other
     */
    static Key translate(const ftxui::Event& event);

private:
    ftxui::Component createMainComponent();

    /// 按终端高度推算两个面板可容纳的条目数，变化时投递 Resize
    void postResizeIfChanged(const RenderSnapshot& snapshot);

    PaneApp& app_;
    ftxui::ScreenInteractive screen_;
    std::pair<size_t, size_t> lastRows_{0, 0};
};

} // namespace paneltalk::client::tui
