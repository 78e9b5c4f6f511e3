/**
 * @file pane_app.cpp
 * @brief PaneApp 实现
 */

#include "app/pane_app.hpp"
#include "base/logger.hpp"
#include <algorithm>

namespace paneltalk {

namespace {
// 时间轮每格 50ms，节拍更短时按节拍取
constexpr int WHEEL_SLOTS = 64;
constexpr int WHEEL_TICK_MS = 50;
} // anonymous namespace

PaneApp::PaneApp(AppOptions options, AdapterFactory factory)
    : options_(std::move(options))
    , store_(options_.store)
    , reconciler_(store_, errors_, options_.reconciler)
    , dispatcher_(store_, errors_)
    , cache_(options_.imageCacheCapacity)
    , pool_(std::make_unique<ThreadPool>(options_.imageWorkers))
    , wheel_(WHEEL_SLOTS, std::min<int>(WHEEL_TICK_MS, static_cast<int>(options_.tick.count()))) {
    renderer_ = std::make_unique<RenderScheduler>(
        store_, cache_, std::make_shared<AsciiImageConverter>(), pool_.get(), &events_, errors_,
        options_.render);
    store_.setMessageHeight([this](const MessageEntity& message) {
        return renderer_->messageHeight(message);
    });
    if (factory) {
        adapter_ = factory(events_);
    }
}

PaneApp::~PaneApp() {
    shutdown();
}

int64_t PaneApp::steadyMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

int64_t PaneApp::wallSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int PaneApp::run() {
    if (!adapter_) {
        LOG() << "[PaneApp] No session adapter configured";
        exitCode_ = EXIT_SESSION_FAILURE;
    } else {
        adapter_->setStateCallback([](AdapterState state, const std::string& message) {
            LOG() << "[PaneApp] Adapter state " << toString(state) << ": " << message;
        });
        store_.setStatus("Connecting to " + adapter_->getName() + " session...");
        renderer_->render(wallSeconds());

        if (!adapter_->start()) {
            LOG() << "[PaneApp] Session adapter " << adapter_->getName() << " failed to start";
            exitCode_ = EXIT_SESSION_FAILURE;
        } else {
            startTicker();
            Event event;
            while (events_.pop(event)) {
                if (!process(event)) {
                    break;
                }
            }
        }
    }

    shutdown();
    LOG() << "[PaneApp] Loop finished: events=" << stats_.events
          << " inputs=" << stats_.userInputs
          << " updates=" << stats_.remoteUpdates
          << " renders=" << renderer_->renderCount()
          << " exit=" << exitCode_;
    if (exitHandler_) {
        exitHandler_(exitCode_);
    }
    return exitCode_;
}

bool PaneApp::process(const Event& event) {
    ++stats_.events;
    const int64_t nowMs = steadyMs();
    bool keepRunning = true;

    try {
        if (auto* input = std::get_if<UserInput>(&event)) {
            ++stats_.userInputs;
            if (dispatcher_.dispatch(*input).quit) {
                LOG() << "[PaneApp] Quit requested";
                exitCode_ = EXIT_OK;
                keepRunning = false;
            }
        } else if (auto* resize = std::get_if<Resize>(&event)) {
            dispatcher_.resize(*resize);
        } else if (auto* update = std::get_if<RemoteUpdate>(&event)) {
            ++stats_.remoteUpdates;
            reconciler_.apply(*update, nowMs);
        } else if (auto* snapshot = std::get_if<InitialSnapshot>(&event)) {
            reconciler_.applySnapshot(*snapshot);
            store_.setStatus(adapter_ ? "Connected (" + adapter_->getName() + ")" : "Connected");
        } else if (auto* failure = std::get_if<SessionFailure>(&event)) {
            LOG() << "[PaneApp] Session failure: " << failure->reason;
            store_.setStatus("Session failed: " + failure->reason);
            exitCode_ = EXIT_SESSION_FAILURE;
            keepRunning = false;
        } else if (std::holds_alternative<Tick>(event)) {
            ++stats_.ticks;
            reconciler_.onTick(nowMs);
            renderer_->onTick();
        } else if (auto* ready = std::get_if<ImageReady>(&event)) {
            renderer_->onImageReady(*ready);
        }
    } catch (const std::exception& e) {
        LOG() << "[PaneApp] Event handling failed: " << e.what();
    }

    // 编辑可能改变消息高度
    store_.fitViewport(Pane::Right);

    if (!store_.invariantsHold()) {
        errors_.record(ErrorKind::InvalidCursorState);
        LOG() << "[PaneApp] " << toString(ErrorKind::InvalidCursorState) << ", repairing panels";
        store_.repair();
    }

    if (keepRunning) {
        forward(reconciler_.syncVisibility());
    }
    renderer_->render(wallSeconds());
    return keepRunning;
}

void PaneApp::forward(const std::vector<OutboundAction>& actions) {
    if (!adapter_) {
        return;
    }
    for (const auto& action : actions) {
        if (auto* fetch = std::get_if<FetchMore>(&action)) {
            adapter_->fetchMore(fetch->chatId, fetch->beforeMessageId);
        } else if (auto* read = std::get_if<MarkRead>(&action)) {
            adapter_->markRead(read->chatId, read->messageId);
        }
        ++stats_.actionsSent;
    }
}

void PaneApp::startTicker() {
    if (tickerRunning_.exchange(true)) {
        return;
    }
    tickTask_ = wheel_.add_periodic_task(static_cast<int>(options_.tick.count()), [this] {
        events_.enqueue(Tick{});
    });
    ticker_ = std::thread([this] {
        const auto interval = std::chrono::milliseconds(wheel_.tick_interval_ms());
        while (tickerRunning_.load()) {
            std::this_thread::sleep_for(interval);
            wheel_.tick();
        }
    });
}

void PaneApp::shutdown() {
    if (tickerRunning_.exchange(false)) {
        wheel_.cancel_task(tickTask_);
        if (ticker_.joinable()) {
            ticker_.join();
        }
    }
    if (adapter_) {
        adapter_->stop();
    }
    events_.stop();
}

} // namespace paneltalk
