/**
 * @file status_bar.hpp
 * @brief 底部状态栏与按键提示
 */

#pragma once

#include <ftxui/dom/elements.hpp>
#include "../styles.hpp"
#include "render/render_snapshot.hpp"

namespace paneltalk::client::tui {

ftxui::Element StatusBarComponent(const RenderSnapshot& snapshot);

} // namespace paneltalk::client::tui
