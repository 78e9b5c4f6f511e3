/**
 * @file header.cpp
 * @brief 顶部标题栏组件实现
 */

#include "header.hpp"

namespace paneltalk::client::tui {

using namespace ftxui;

Element HeaderComponent(const RenderSnapshot& snapshot) {
    return hbox({
        text(snapshot.header) | bold | color(colorPrimary()),
        filler(),
    }) | border;
}

} // namespace paneltalk::client::tui
