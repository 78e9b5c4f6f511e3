/**
 * @file mock_session_adapter.hpp
 * @brief 模拟会话适配器
 *
 * 用于开发和测试，不需要连接真实的消息服务。
 * 生成确定性的初始数据（相同种子得到相同数据），然后周期性推送随机增量更新：
 * 新消息、编辑、删除、输入状态、图片、会话改名、文件夹变化。
 */

#pragma once

#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <map>
#include <random>
#include <chrono>
#include "session/session_adapter.hpp"

namespace paneltalk {

struct MockSessionOptions {
    std::chrono::milliseconds interval{1500};   ///< 增量更新间隔
    uint32_t seed = 42;                         ///< 随机种子
    int failAfter = 0;                          ///< 推送 N 条增量后投递 SessionFailure，0 表示不失败
    size_t historyPerChat = 30;                 ///< 初始快照中每个会话的消息数
    size_t fetchBatch = 20;                     ///< 每次 fetchMore 返回的消息数
};

/**
 * @class MockSessionAdapter
 * @brief 模拟会话适配器
 *
 * 工作线程持有全部模拟数据；fetchMore / markRead 只把请求放入内部队列，
 * 由工作线程处理，调用方不会被阻塞。
 *
 * @par 使用示例
 * @code
 * EventQueue events;
 * MockSessionAdapter adapter(events, options);
 * adapter.start();
 * Event ev;
 * while (events.pop(ev)) { ... }
 * adapter.stop();
 * @endcode
 */
class MockSessionAdapter : public SessionAdapter {
public:
    explicit MockSessionAdapter(EventQueue& events, MockSessionOptions options = MockSessionOptions());

    ~MockSessionAdapter() override;

    MockSessionAdapter(const MockSessionAdapter&) = delete;
    MockSessionAdapter& operator=(const MockSessionAdapter&) = delete;

    // =========================================================================
    // SessionAdapter 接口实现
    // =========================================================================

    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }
    AdapterState getState() const override { return state_.load(); }

    void fetchMore(ChatId chatId, MessageId beforeMessageId) override;
    void markRead(ChatId chatId, MessageId messageId) override;

    void setStateCallback(StateCallback callback) override;

    std::string getName() const override { return "Mock"; }

    // =========================================================================
    // Mock 特有
    // =========================================================================

    size_t updatesSent() const { return updatesSent_.load(); }
    size_t markReadRequests() const { return markReadRequests_.load(); }

    /**
     * @brief 生成一张 PGM (P5) 测试图片
     * @param variant 图案编号：0 水平渐变，1 同心圆，2 棋盘
     */
    static std::vector<uint8_t> makeTestImage(int variant, int width = 64, int height = 32);

private:
    struct ChatModel {
        ChatEntity chat;
        FolderId folder = 0;
        MessageId nextId = 0;           ///< 下一条新消息的 ID
        MessageId oldestId = 0;         ///< 已生成的最旧消息 ID
        int64_t oldestTimestamp = 0;
        std::vector<MessageId> live;    ///< 未删除的消息
        std::map<MessageId, MessageEntity> messages;
        bool typing = false;
    };

    void run();

    InitialSnapshot buildSnapshot();
    RemoteUpdate nextUpdate();
    void handleRequests();

    MessageEntity makeMessage(ChatModel& model, MessageId id, int64_t timestamp, bool incoming);
    ImageRef makeImageRef(ChatId chatId, MessageId id, int revision);
    FolderEntity folderOf(FolderId id) const;
    ChatModel& pickChat();

    void notifyState(AdapterState state, const std::string& message);

    static int64_t nowSeconds();

    MockSessionOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<AdapterState> state_{AdapterState::DISCONNECTED};
    std::thread workerThread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutboundAction> requests_;
    StateCallback stateCallback_;

    std::atomic<size_t> updatesSent_{0};
    std::atomic<size_t> markReadRequests_{0};

    // 以下只在工作线程访问
    std::mt19937 rng_;
    std::map<FolderId, std::pair<std::string, int>> folders_;   ///< id -> (名称, 排序)
    std::map<ChatId, ChatModel> chats_;
    ChatId nextChatId_ = 0;
    int imageRevision_ = 0;
};

} // namespace paneltalk
