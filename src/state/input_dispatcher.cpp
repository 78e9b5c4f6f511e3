/**
 * @file input_dispatcher.cpp
 * @brief InputDispatcher 实现
 */

#include "state/input_dispatcher.hpp"
#include <algorithm>

namespace paneltalk {

InputDispatcher::InputDispatcher(ViewStateStore& store, ErrorCounters& errors)
    : store_(store)
    , errors_(errors) {}

DispatchResult InputDispatcher::dispatch(const UserInput& input) {
    DispatchResult result;
    const Pane focused = store_.focusedPane();
    const int page = static_cast<int>(std::max<size_t>(store_.visibleCount(focused), 1));

    switch (input.key) {
        case Key::Tab:
            result.changed = store_.setFocus(otherPane(focused));
            break;
        case Key::Up:
            result.changed = move(-1);
            break;
        case Key::Down:
            result.changed = move(1);
            break;
        case Key::PageUp:
            result.changed = move(-page);
            break;
        case Key::PageDown:
            result.changed = move(page);
            break;
        case Key::Home:
            result.changed = store_.jumpCursor(focused, false) || noop();
            break;
        case Key::End:
            result.changed = store_.jumpCursor(focused, true) || noop();
            break;
        case Key::Enter:
            // 消息面板中 Enter 无动作
            if (store_.mode() == NavMode::MessagesPane) {
                break;
            }
            result.changed = store_.openSelected() || noop();
            break;
        case Key::Esc:
            result.changed = store_.goBack() || noop();
            break;
        case Key::CtrlQ:
            result.quit = true;
            break;
        case Key::Other:
            break;
    }
    return result;
}

DispatchResult InputDispatcher::resize(const Resize& resize) {
    DispatchResult result;
    const bool left = store_.setViewportRows(Pane::Left, resize.leftRows);
    const bool right = store_.setViewportRows(Pane::Right, resize.rightRows);
    result.changed = left || right;
    return result;
}

bool InputDispatcher::move(int delta) {
    return store_.moveCursor(store_.focusedPane(), delta) || noop();
}

bool InputDispatcher::noop() {
    errors_.record(ErrorKind::EmptyPaneNavigation);
    return false;
}

} // namespace paneltalk
