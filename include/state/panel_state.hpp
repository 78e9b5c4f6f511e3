/**
 * @file panel_state.hpp
 * @brief 面板状态与位置保持规则
 *
 * 每个面板记录：显示的实体集合、选择光标（当前有序序列中的下标）、
 * 滚动偏移（最上方可见下标）以及是否聚焦。
 *
 * 序列发生插入/删除/重排时，光标和滚动偏移按实体 ID 重新推导：
 * - 原选中实体仍存在 -> 继续选中它
 * - 原选中实体被移除 -> 选中原位置处或其下方最近的存活实体，没有则取上方
 * - 序列为空 -> 光标为空
 * - 原顶部实体仍存在 -> 保持在顶部，否则取其上方最近的存活实体
 */

#pragma once

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <utility>

namespace paneltalk {

/**
 * @brief 两个顶层面板
 *
 * Left：文件夹 / 会话列表；Right：消息列表
 */
enum class Pane {
    Left,
    Right
};

inline Pane otherPane(Pane pane) {
    return pane == Pane::Left ? Pane::Right : Pane::Left;
}

/**
 * @brief 面板显示的实体集合
 */
enum class ContentKind {
    Empty,
    FolderList,     ///< 根层：文件夹列表
    ChatList,       ///< 某个文件夹内的会话
    MessageList     ///< 某个会话的消息
};

struct PaneContent {
    ContentKind kind = ContentKind::Empty;
    int64_t id = 0;     ///< ChatList 时为文件夹 ID，MessageList 时为会话 ID

    static PaneContent empty() { return {}; }
    static PaneContent folders() { return {ContentKind::FolderList, 0}; }
    static PaneContent chats(int64_t folderId) { return {ContentKind::ChatList, folderId}; }
    static PaneContent messages(int64_t chatId) { return {ContentKind::MessageList, chatId}; }

    bool operator==(const PaneContent& other) const {
        return kind == other.kind && (kind == ContentKind::Empty || kind == ContentKind::FolderList || id == other.id);
    }
    bool operator!=(const PaneContent& other) const { return !(*this == other); }
};

struct PanelState {
    PaneContent content;
    std::optional<size_t> cursor;   ///< 空序列时为空
    size_t scrollOffset = 0;
    bool focused = false;
};

/**
 * @brief 变更前记录的位置锚点
 *
 * 保存变更前的序列副本，用于在选中实体被移除时寻找邻居。
 */
struct PositionAnchor {
    std::vector<int64_t> before;
    std::optional<int64_t> selectedId;
    size_t selectedIndex = 0;
    std::optional<int64_t> topId;
    size_t topIndex = 0;
};

/**
 * @brief 可见窗口：可用行数与每项高度
 *
 * rowHeight 按序列下标返回该项占用的行数，为空时每项一行。
 * 单项高于窗口时仍单独显示（至少可见一项）。
 */
struct Viewport {
    size_t lines = 1;
    std::function<size_t(size_t index)> rowHeight;

    Viewport(size_t lines = 1, std::function<size_t(size_t)> rowHeight = nullptr)
        : lines(lines), rowHeight(std::move(rowHeight)) {}

    size_t heightOf(size_t index) const;

    /// 从 first 开始能放下的项数，first 合法时至少为 1
    size_t fit(size_t first, size_t sequenceSize) const;
};

/**
 * @brief 后退栈条目：进入下一层之前两个面板的完整快照
 */
struct NavigationEntry {
    PanelState left;
    PanelState right;
    PositionAnchor leftAnchor;
    PositionAnchor rightAnchor;
};

/**
 * @brief 记录面板在序列 seq 上的当前位置
 */
PositionAnchor capturePosition(const PanelState& panel, const std::vector<int64_t>& seq);

/**
 * @brief 按位置保持规则，在新序列上恢复光标与滚动偏移
 * @param followTail 变更前光标位于末尾且末尾之后追加了新实体时，光标跟随到新末尾
 */
void restorePosition(PanelState& panel, const PositionAnchor& anchor,
                     const std::vector<int64_t>& seq, const Viewport& viewport,
                     bool followTail = false);

/**
 * @brief 调整滚动偏移使光标位于可见窗口内，并把两者夹紧到合法范围
 */
void ensureCursorVisible(PanelState& panel, size_t sequenceSize, const Viewport& viewport);

/**
 * @brief 面板状态是否满足不变量（光标合法、滚动偏移合法）
 */
bool panelValid(const PanelState& panel, size_t sequenceSize);

} // namespace paneltalk
