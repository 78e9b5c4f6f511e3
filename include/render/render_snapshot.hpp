/**
 * @file render_snapshot.hpp
 * @brief 不可变的渲染快照
 *
 * 渲染调度器在中心循环线程上由视图状态仓库生成快照，
 * 终端前端只读取快照，不接触仓库。
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace paneltalk {

enum class RowKind {
    Folder,
    Chat,
    Message
};

/**
 * @brief 面板中的一行条目（消息可能占多行）
 */
struct DisplayRow {
    RowKind kind = RowKind::Folder;
    int64_t id = 0;
    std::vector<std::string> lines;   ///< 第一行为标题行
    bool selected = false;
    bool unread = false;
    bool deleted = false;
    bool image = false;               ///< 包含字符画
    bool pending = false;             ///< 字符画仍在转换，显示占位符
};

/**
 * @brief 一个面板的渲染描述
 *
 * rows 只包含滚动窗口内的条目。
 */
struct PaneDescriptor {
    std::string title;
    std::vector<DisplayRow> rows;
    std::optional<size_t> cursor;     ///< 在完整序列中的下标
    size_t scrollOffset = 0;
    size_t total = 0;                 ///< 完整序列长度
    bool focused = false;
    std::string emptyText;            ///< 序列为空时显示
};

struct RenderSnapshot {
    uint64_t storeVersion = 0;
    uint64_t frame = 0;               ///< 节拍计数（动画）
    PaneDescriptor left;
    PaneDescriptor right;
    std::string header;
    std::string status;
    std::string footer;
};

} // namespace paneltalk
