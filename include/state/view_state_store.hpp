/**
 * @file view_state_store.hpp
 * @brief 视图状态仓库
 *
 * 两个面板的全部显示状态（文件夹、会话、消息、焦点、光标、滚动）的唯一持有者。
 * 只由中心循环线程修改（经对账器与输入调度器），渲染调度器只读。
 * 因此仓库本身不加锁。
 */

#pragma once

#include "model/entities.hpp"
#include "state/panel_state.hpp"
#include <string>
#include <vector>
#include <array>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include <functional>

namespace paneltalk {

/**
 * @brief 仓库配置
 */
struct StoreOptions {
    bool showAllChats = true;               ///< 是否合成 "全部会话" 伪文件夹
    std::string allChatsTitle = "All Chats";
    size_t maxMessages = 100;               ///< 每个会话最多保留的已加载消息数
    bool followTail = true;                 ///< 消息面板光标在末尾时跟随新消息
    size_t defaultViewportRows = 20;
};

/**
 * @brief 当前输入所作用的层级
 */
enum class NavMode {
    FoldersPane,
    ChatsPane,
    MessagesPane
};

/**
 * @brief upsertMessage 的结果
 */
enum class UpsertResult {
    Inserted,
    Updated,
    Unchanged
};

/**
 * @class ViewStateStore
 * @brief 单写者视图状态仓库
 *
 * 任何改变有序序列的操作都在同一次调用中按位置保持规则修正光标与滚动偏移，
 * 仓库对外从不暴露非法光标。
 *
 * version() 在每次可见变更后递增，作为渲染调度器的脏标记。
 */
class ViewStateStore {
public:
    explicit ViewStateStore(StoreOptions options = StoreOptions());

    // =========================================================================
    // 只读访问
    // =========================================================================

    const PanelState& panel(Pane pane) const { return panels_[index(pane)]; }
    Pane focusedPane() const;
    NavMode mode() const;

    /// 面板当前显示的有序 ID 序列
    std::vector<int64_t> sequence(Pane pane) const;
    std::vector<int64_t> sequence(const PaneContent& content) const;

    /// 当前选中的实体 ID
    std::optional<int64_t> selectedId(Pane pane) const;

    /// 视口高度（行）。消息面板按每条消息的实际行数折算可见条目
    size_t viewportRows(Pane pane) const { return rows_[index(pane)]; }

    /// 从滚动偏移开始，当前能完整显示的条目数
    size_t visibleCount(Pane pane) const;

    /**
     * @brief 文件夹信息（含 "全部会话" 伪文件夹）
     * @return 不存在时为空
     */
    std::optional<FolderEntity> folderInfo(FolderId id) const;

    const ChatEntity* findChat(ChatId id) const;
    const MessageEntity* findMessage(ChatId chatId, MessageId messageId) const;

    size_t folderCount() const { return folders_.size(); }
    size_t chatCount() const { return chats_.size(); }
    size_t messageCount(ChatId chatId) const;

    size_t backStackDepth() const { return backStack_.size(); }
    const std::string& status() const { return status_; }
    const StoreOptions& options() const { return options_; }

    uint64_t version() const { return version_; }

    /**
     * @brief 检查全部不变量：恰好一个面板聚焦、两面板光标与滚动合法
     */
    bool invariantsHold() const;

    // =========================================================================
    // 实体变更（对账器调用）
    // =========================================================================

    /**
     * @brief 插入或更新文件夹
     * @return true 新插入
     *
     * 引用的未知会话会以占位会话形式创建。
     * position 改变视为显式重排，其他字段原地更新。
     */
    bool upsertFolder(const FolderEntity& folder);

    /**
     * @brief 删除文件夹
     *
     * 若左面板正显示该文件夹的会话，自动返回文件夹列表，
     * 并丢弃后退栈中进入该文件夹之后的条目。
     */
    bool removeFolder(FolderId id);

    /**
     * @brief 插入或更新会话元数据（名称、预览、未读数、活跃时间）
     * @return true 新插入
     *
     * 已加载的消息列表与输入状态由仓库维护，不被覆盖。
     * lastActivity 变新视为显式重排（"全部会话" 按活跃时间倒序）。
     */
    bool upsertChat(const ChatEntity& chat);

    /**
     * @brief 确保会话存在，不存在时创建占位会话
     * @return true 新创建了占位会话
     */
    bool ensureChat(ChatId id);

    bool removeChat(ChatId id);

    /**
     * @brief 更新会话最近活跃时间（更新时在 "全部会话" 中前移）
     */
    bool touchChat(ChatId id, int64_t activity);

    /// 设置会话预览与未读数（只改数据，不动光标）
    bool setChatSummary(ChatId id, const std::string& preview, int unreadCount);

    /**
     * @brief 插入或原地更新消息
     *
     * 新消息按 (timestamp, id) 插入到时间序位置；
     * 已存在的消息只更新正文/图片/标记，位置不变；
     * read 与 deleted 标记只会从 false 变 true。
     */
    UpsertResult upsertMessage(ChatId chatId, const MessageEntity& message);

    /**
     * @brief 设置墓碑标记，不改变序列
     */
    bool markDeleted(ChatId chatId, MessageId messageId);

    /**
     * @brief 把会话中直到 uptoId（含）的消息标记为已读
     * @return 新标记为已读的消息数
     */
    size_t markRead(ChatId chatId, MessageId uptoId);

    /**
     * @brief 压缩：物理移除不可见的墓碑消息，并裁剪超出上限的最旧消息
     * @return 移除的消息数
     *
     * 任一面板可见窗口内或光标所在的消息不会被移除。
     */
    size_t compact(ChatId chatId);

    bool setTyping(ChatId chatId, const std::string& user, int64_t untilMs);
    bool clearTyping(ChatId chatId);

    /// 清除所有过期的输入状态，返回清除的数量
    size_t clearExpiredTyping(int64_t nowMs);

    // =========================================================================
    // 导航（输入调度器调用）
    // =========================================================================

    /// 设置焦点，另一面板失焦
    bool setFocus(Pane pane);

    /**
     * @brief 移动光标（夹紧，不回绕）
     * @return false 到达边界或面板为空，无变化
     */
    bool moveCursor(Pane pane, int delta);

    /// 光标跳到首/尾
    bool jumpCursor(Pane pane, bool toEnd);

    /**
     * @brief 打开聚焦面板中选中的文件夹或会话
     * @return false 无可打开的选中项
     *
     * 打开前把两个面板的完整快照压入后退栈。
     */
    bool openSelected();

    /**
     * @brief 弹出后退栈，精确恢复之前的面板内容、光标、滚动与焦点
     * @return false 后退栈为空
     */
    bool goBack();

    bool setViewportRows(Pane pane, size_t rows);

    /// 消息占用的行数（含标题与间隔），由渲染层提供；未设置时每条一行
    using MessageHeight = std::function<size_t(const MessageEntity&)>;
    void setMessageHeight(MessageHeight height);

    /**
     * @brief 条目高度变化后重新让光标落在可见窗口内
     * @return true 滚动偏移被调整
     */
    bool fitViewport(Pane pane);

    void setStatus(const std::string& status);

    /**
     * @brief 把两个面板夹紧回合法状态
     * @return true 确实修正了内容
     */
    bool repair();

private:
    static size_t index(Pane pane) { return pane == Pane::Left ? 0 : 1; }

    /**
     * @brief 执行可能改变序列的变更，之后按位置保持规则修正两个面板
     */
    template <typename Mutator>
    void reshape(Mutator&& mutate);

    void touch() { ++version_; }

    /// 面板 i 在序列 seq 上的可见窗口（返回值引用 seq，只能立即使用）
    Viewport viewport(size_t i, const std::vector<int64_t>& seq) const;

    ChatEntity& ensureChatEntry(ChatId id);
    void placeFolder(FolderId id);
    void placeChat(ChatId id);
    void recomputeFolderUnread();
    bool isMessageShown(ChatId chatId, size_t messageIndex) const;

    StoreOptions options_;

    std::unordered_map<FolderId, FolderEntity> folders_;
    std::vector<FolderId> folderOrder_;
    std::unordered_map<ChatId, ChatEntity> chats_;
    std::vector<ChatId> allChatsOrder_;
    std::unordered_map<ChatId, std::unordered_map<MessageId, MessageEntity>> messages_;

    std::array<PanelState, 2> panels_;
    std::array<size_t, 2> rows_;
    MessageHeight messageHeight_;
    std::vector<NavigationEntry> backStack_;

    std::string status_;
    uint64_t version_ = 0;
};

} // namespace paneltalk
