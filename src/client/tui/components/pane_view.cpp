/**
 * @file pane_view.cpp
 * @brief 面板视图实现
 */

#include "pane_view.hpp"

namespace paneltalk::client::tui {

using namespace ftxui;

namespace {

Element rowElement(const DisplayRow& row, bool paneFocused) {
    Elements lines;
    lines.reserve(row.lines.size() + 1);
    for (size_t i = 0; i < row.lines.size(); ++i) {
        Element line = text(row.lines[i]);
        if (i == 0) {
            line = line | bold;
            if (row.unread && row.kind != RowKind::Message) {
                line = line | color(colorUnread());
            }
        } else if (row.deleted || row.pending || row.kind == RowKind::Chat) {
            line = line | dim;
        }
        lines.push_back(line);
    }
    if (row.kind == RowKind::Message) {
        lines.push_back(text(""));
    }

    Element element = vbox(std::move(lines));
    if (row.selected) {
        element = paneFocused ? element | inverted : element | bold;
    }
    return element;
}

} // anonymous namespace

Element PaneViewComponent(const PaneDescriptor& pane) {
    Element body;
    if (pane.rows.empty()) {
        body = text(pane.emptyText) | center | dim;
    } else {
        Elements rows;
        rows.reserve(pane.rows.size());
        for (const auto& row : pane.rows) {
            rows.push_back(rowElement(row, pane.focused));
        }
        body = vbox(std::move(rows));
    }

    std::string title = pane.title;
    if (pane.total > 0 && pane.cursor) {
        title += " " + std::to_string(*pane.cursor + 1) + "/" + std::to_string(pane.total);
    }
    return styledBorder(body | flex, title, pane.focused);
}

} // namespace paneltalk::client::tui
