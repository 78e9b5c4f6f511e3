/**
 * @file status_bar.cpp
 * @brief 底部状态栏实现
 */

#include "status_bar.hpp"

namespace paneltalk::client::tui {

using namespace ftxui;

Element StatusBarComponent(const RenderSnapshot& snapshot) {
    const bool failed = snapshot.status.rfind("Session failed", 0) == 0;
    Element status = snapshot.status.empty()
        ? text("")
        : text(" " + snapshot.status + " ") | color(failed ? colorWarning() : colorUnread());
    return vbox({
        status,
        hbox({
            text(" " + snapshot.footer + " ") | color(colorMuted()),
            filler(),
        }) | border,
    });
}

} // namespace paneltalk::client::tui
