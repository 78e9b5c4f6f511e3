/**
 * @file error.hpp
 * @brief 中心循环内可能出现的错误类别
 *
 * 除 SessionFailure 外，这些错误都在产生处就地处理（夹紧到合法状态），
 * 这里只用于日志与计数。
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace paneltalk {

enum class ErrorKind {
    InvalidCursorState,     ///< 光标不变量被破坏（程序错误）
    RenderBudgetExceeded,   ///< 图片转换超出时间预算，先显示占位符
    UnknownUpdateEntity,    ///< 更新引用了未知的会话/文件夹，按隐式 upsert 处理
    EmptyPaneNavigation,    ///< 在空面板或边界上导航，无操作
};

constexpr size_t ERROR_KIND_COUNT = 4;

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCursorState:   return "InvalidCursorState";
        case ErrorKind::RenderBudgetExceeded: return "RenderBudgetExceeded";
        case ErrorKind::UnknownUpdateEntity:  return "UnknownUpdateEntity";
        case ErrorKind::EmptyPaneNavigation:  return "EmptyPaneNavigation";
    }
    return "Unknown";
}

/**
 * @brief 各类错误的发生次数
 */
class ErrorCounters {
public:
    void record(ErrorKind kind) { ++counts_[static_cast<size_t>(kind)]; }

    uint64_t count(ErrorKind kind) const { return counts_[static_cast<size_t>(kind)]; }

private:
    std::array<uint64_t, ERROR_KIND_COUNT> counts_{};
};

} // namespace paneltalk
