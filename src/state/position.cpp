/**
 * @file position.cpp
 * @brief 位置保持规则实现
 */

#include "state/panel_state.hpp"
#include <unordered_map>
#include <algorithm>

namespace paneltalk {

namespace {

using IndexMap = std::unordered_map<int64_t, size_t>;

IndexMap indexOf(const std::vector<int64_t>& seq) {
    IndexMap map;
    map.reserve(seq.size());
    for (size_t i = 0; i < seq.size(); ++i) {
        map.emplace(seq[i], i);
    }
    return map;
}

// 在旧序列中从 start 向 step 方向寻找第一个仍存在于新序列中的实体
std::optional<size_t> survivor(const std::vector<int64_t>& before, const IndexMap& now,
                               long start, long step) {
    for (long i = start; i >= 0 && i < static_cast<long>(before.size()); i += step) {
        auto it = now.find(before[static_cast<size_t>(i)]);
        if (it != now.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

PositionAnchor capturePosition(const PanelState& panel, const std::vector<int64_t>& seq) {
    PositionAnchor anchor;
    anchor.before = seq;
    if (panel.cursor && *panel.cursor < seq.size()) {
        anchor.selectedId = seq[*panel.cursor];
        anchor.selectedIndex = *panel.cursor;
    }
    if (panel.scrollOffset < seq.size()) {
        anchor.topId = seq[panel.scrollOffset];
        anchor.topIndex = panel.scrollOffset;
    }
    return anchor;
}

void restorePosition(PanelState& panel, const PositionAnchor& anchor,
                     const std::vector<int64_t>& seq, const Viewport& viewport,
                     bool followTail) {
    if (seq.empty()) {
        panel.cursor.reset();
        panel.scrollOffset = 0;
        return;
    }

    const IndexMap now = indexOf(seq);
    const long selected = static_cast<long>(anchor.selectedIndex);
    const long top = static_cast<long>(anchor.topIndex);

    // 光标
    if (!anchor.selectedId) {
        panel.cursor = 0;
    } else if (auto it = now.find(*anchor.selectedId); it != now.end()) {
        panel.cursor = it->second;
        const bool wasTail = anchor.selectedIndex + 1 == anchor.before.size();
        if (followTail && wasTail && it->second + 1 < seq.size()) {
            panel.cursor = seq.size() - 1;
        }
    } else if (auto below = survivor(anchor.before, now, selected + 1, +1)) {
        panel.cursor = *below;
    } else if (auto above = survivor(anchor.before, now, selected - 1, -1)) {
        panel.cursor = *above;
    } else {
        panel.cursor = std::min(anchor.selectedIndex, seq.size() - 1);
    }

    // 滚动偏移
    if (!anchor.topId) {
        panel.scrollOffset = 0;
    } else if (auto it = now.find(*anchor.topId); it != now.end()) {
        panel.scrollOffset = it->second;
    } else if (auto above = survivor(anchor.before, now, top - 1, -1)) {
        panel.scrollOffset = *above;
    } else {
        panel.scrollOffset = 0;
    }

    ensureCursorVisible(panel, seq.size(), viewport);
}

size_t Viewport::heightOf(size_t index) const {
    return rowHeight ? std::max<size_t>(rowHeight(index), 1) : 1;
}

size_t Viewport::fit(size_t first, size_t sequenceSize) const {
    size_t used = 0;
    size_t count = 0;
    for (size_t i = first; i < sequenceSize; ++i) {
        const size_t h = heightOf(i);
        if (count > 0 && used + h > lines) {
            break;
        }
        used += h;
        ++count;
    }
    return count;
}

void ensureCursorVisible(PanelState& panel, size_t sequenceSize, const Viewport& viewport) {
    if (sequenceSize == 0) {
        panel.cursor.reset();
        panel.scrollOffset = 0;
        return;
    }

    if (!panel.cursor) {
        panel.cursor = 0;
    }
    if (*panel.cursor >= sequenceSize) {
        panel.cursor = sequenceSize - 1;
    }
    if (panel.scrollOffset >= sequenceSize) {
        panel.scrollOffset = sequenceSize - 1;
    }
    if (*panel.cursor < panel.scrollOffset) {
        panel.scrollOffset = *panel.cursor;
    } else if (*panel.cursor >= panel.scrollOffset + viewport.fit(panel.scrollOffset, sequenceSize)) {
        // 光标作为窗口最后一项，向上尽量多放
        size_t top = *panel.cursor;
        size_t used = viewport.heightOf(top);
        while (top > 0 && used + viewport.heightOf(top - 1) <= viewport.lines) {
            --top;
            used += viewport.heightOf(top);
        }
        panel.scrollOffset = top;
    }
}

bool panelValid(const PanelState& panel, size_t sequenceSize) {
    if (sequenceSize == 0) {
        return !panel.cursor.has_value() && panel.scrollOffset == 0;
    }
    return panel.cursor.has_value() && *panel.cursor < sequenceSize &&
           panel.scrollOffset < sequenceSize;
}

} // namespace paneltalk
