/**
 * @file pane_view.hpp
 * @brief 面板视图（文件夹 / 会话 / 消息列表）
 */

#pragma once

#include <ftxui/dom/elements.hpp>
#include "../styles.hpp"
#include "render/render_snapshot.hpp"

namespace paneltalk::client::tui {

/**
 * @brief 把面板描述渲染为带边框的列表
 *
 * 选中行在聚焦面板中反色显示，失焦时加粗。
 */
ftxui::Element PaneViewComponent(const PaneDescriptor& pane);

} // namespace paneltalk::client::tui
