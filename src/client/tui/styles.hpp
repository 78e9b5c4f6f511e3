/**
 * @file styles.hpp
 * @brief TUI 样式定义
 */

#pragma once

#include <ftxui/dom/elements.hpp>
#include <string>

namespace paneltalk::client::tui {

using namespace ftxui;

// 颜色定义
inline Color colorPrimary() { return Color::Cyan; }
inline Color colorUnread() { return Color::Yellow; }
inline Color colorWarning() { return Color::Red; }
inline Color colorMuted() { return Color::GrayDark; }

// 边框样式：聚焦面板高亮标题
inline Element styledBorder(Element inner, const std::string& title, bool focused) {
    auto caption = text(" " + title + " ") | bold;
    if (focused) {
        caption = caption | color(colorPrimary());
    }
    return window(caption, inner);
}

} // namespace paneltalk::client::tui
