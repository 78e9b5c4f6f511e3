/**
 * @file input_dispatcher.hpp
 * @brief 按键到导航意图的映射
 *
 * | 按键              | 动作                                   |
 * |-------------------|----------------------------------------|
 * | Tab               | 切换聚焦面板                           |
 * | Up / Down         | 光标上下移动一行（夹紧）               |
 * | PageUp / PageDown | 光标移动一屏                           |
 * | Home / End        | 光标跳到首/尾                          |
 * | Enter             | 打开选中的文件夹或会话                 |
 * | Esc               | 弹出后退栈                             |
 * | Ctrl+Q            | 请求退出                               |
 */

#pragma once

#include "core/event.hpp"
#include "core/error.hpp"
#include "state/view_state_store.hpp"

namespace paneltalk {

struct DispatchResult {
    bool changed = false;   ///< 仓库状态发生变化
    bool quit = false;      ///< 用户请求退出
};

/**
 * @class InputDispatcher
 * @brief 在中心循环线程上把 UserInput / Resize 翻译为仓库操作
 *
 * 在空面板或边界上的导航记为 EmptyPaneNavigation，状态不变。
 */
class InputDispatcher {
public:
    InputDispatcher(ViewStateStore& store, ErrorCounters& errors);

    DispatchResult dispatch(const UserInput& input);
    DispatchResult resize(const Resize& resize);

private:
    bool move(int delta);
    bool noop();

    ViewStateStore& store_;
    ErrorCounters& errors_;
};

} // namespace paneltalk
