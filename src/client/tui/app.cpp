/**
 * @file app.cpp
 * @brief TUI 主应用实现
 */

#include "app.hpp"
#include "styles.hpp"
#include "components/header.hpp"
#include "components/pane_view.hpp"
#include "components/status_bar.hpp"
#include <ftxui/screen/terminal.hpp>
#include <algorithm>

namespace paneltalk::client::tui {

using namespace ftxui;

namespace {
// 标题栏(3) + 状态行(1) + 按键提示(3) + 面板边框(2)
constexpr int CHROME_ROWS = 9;
} // anonymous namespace

TuiApp::TuiApp(PaneApp& app)
    : app_(app)
    , screen_(ScreenInteractive::Fullscreen()) {}

void TuiApp::run() {
    auto mainComponent = createMainComponent();
    screen_.Loop(mainComponent);
}

void TuiApp::requestExit() {
    screen_.Post([this] { screen_.Exit(); });
}

void TuiApp::refresh() {
    screen_.Post(Event::Custom);
}

Key TuiApp::translate(const Event& event) {
    if (event == Event::Tab) return Key::Tab;
    if (event == Event::ArrowUp) return Key::Up;
    if (event == Event::ArrowDown) return Key::Down;
    if (event == Event::PageUp) return Key::PageUp;
    if (event == Event::PageDown) return Key::PageDown;
    if (event == Event::Home) return Key::Home;
    if (event == Event::End) return Key::End;
    if (event == Event::Return) return Key::Enter;
    if (event == Event::Escape) return Key::Esc;
    if (event.input() == "\x11") return Key::CtrlQ;
    return Key::Other;
}

void TuiApp::postResizeIfChanged(const RenderSnapshot& snapshot) {
    const int height = Terminal::Size().dimy;
    const int paneLines = std::max(1, height - CHROME_ROWS);

    // 会话列表每项两行，文件夹列表每项一行
    const bool chatRows = !snapshot.left.rows.empty() && snapshot.left.rows.front().kind == RowKind::Chat;
    const size_t leftRows = static_cast<size_t>(std::max(1, chatRows ? paneLines / 2 : paneLines));
    // 消息面板按行数上报，每条消息的高度由仓库折算
    const size_t rightRows = static_cast<size_t>(paneLines);

    if (lastRows_.first != leftRows || lastRows_.second != rightRows) {
        lastRows_ = {leftRows, rightRows};
        app_.events().enqueue(Resize{leftRows, rightRows});
    }
}

Component TuiApp::createMainComponent() {
    auto base = Renderer([this] {
        auto snapshot = app_.renderer().latest();
        if (!snapshot) {
            return text("Loading...") | center;
        }
        postResizeIfChanged(*snapshot);

        auto leftPanel = PaneViewComponent(snapshot->left) | size(WIDTH, EQUAL, 40);
        auto rightPanel = PaneViewComponent(snapshot->right) | flex;

        return vbox({
            HeaderComponent(*snapshot),
            hbox({
                leftPanel,
                rightPanel,
            }) | flex,
            StatusBarComponent(*snapshot),
        });
    });

    // 所有识别的按键都交给中心循环，界面本身不保存任何导航状态
    return CatchEvent(base, [this](Event event) {
        const Key key = translate(event);
        if (key == Key::Other) {
            return false;
        }
        app_.events().enqueue(UserInput{key});
        return true;
    });
}

} // namespace paneltalk::client::tui
