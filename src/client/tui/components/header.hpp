/**
 * @file header.hpp
 * @brief 顶部标题栏组件
 */

#pragma once

#include <ftxui/dom/elements.hpp>
#include "../styles.hpp"
#include "render/render_snapshot.hpp"

namespace paneltalk::client::tui {

/**
 * @brief 创建顶部标题栏
 *
 * 显示：应用名、当前文件夹与会话的路径
 */
ftxui::Element HeaderComponent(const RenderSnapshot& snapshot);

} // namespace paneltalk::client::tui
