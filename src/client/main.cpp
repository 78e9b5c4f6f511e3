/**
 * @file main.cpp
 * @brief 双面板消息客户端入口点
 *
 * 启动流程：
 * 1. 解析命令行参数，加载配置
 * 2. 创建中心循环与会话适配器
 * 3. 在后台线程运行中心循环，主线程运行 TUI
 */

#include "tui/app.hpp"
#include "app/pane_app.hpp"
#include "app/app_options.hpp"
#include "session/mock_session_adapter.hpp"
#include "base/config.hpp"
#include "base/logger.hpp"

#include <iostream>
#include <thread>
#include <filesystem>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  -c, --config <path>   Path to paneltalk.ini\n"
              << "  --ticks-ms <ms>       Tick interval override (default: 250)\n"
              << "  --help                Show this help message\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    int ticksMs = 0;

    // 解析命令行参数
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--ticks-ms" && i + 1 < argc) {
            try {
                ticksMs = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                ticksMs = -1;
            }
            if (ticksMs <= 0) {
                std::cerr << "Invalid --ticks-ms value" << std::endl;
                return paneltalk::EXIT_STARTUP_ERROR;
            }
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return paneltalk::EXIT_OK;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return paneltalk::EXIT_STARTUP_ERROR;
        }
    }

    // 加载配置文件（可选）
    if (!configPath.empty()) {
        if (!std::filesystem::exists(configPath)) {
            std::cerr << "Config file not found: " << configPath << std::endl;
            return paneltalk::EXIT_STARTUP_ERROR;
        }
        paneltalk::Config::instance().load(configPath);
    }

    paneltalk::AppOptions options;
    try {
        options = paneltalk::AppOptions::fromConfig(paneltalk::Config::instance());
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return paneltalk::EXIT_STARTUP_ERROR;
    }
    if (ticksMs > 0) {
        options.tick = std::chrono::milliseconds(ticksMs);
    }

    try {
        paneltalk::PaneApp app(options, [&options](paneltalk::EventQueue& events) {
            return std::make_unique<paneltalk::MockSessionAdapter>(events, options.mock);
        });
        paneltalk::client::tui::TuiApp tuiApp(app);

        app.renderer().setSink([&tuiApp] { tuiApp.refresh(); });
        app.setExitHandler([&tuiApp](int) { tuiApp.requestExit(); });

        // 全屏 TUI 占用终端：写入日志文件，或关闭日志输出
        if (!options.logFile.empty() && paneltalk::Logger::instance().setOutputFile(options.logFile)) {
            LOG() << "Logging to " << options.logFile;
        } else {
            paneltalk::Logger::instance().setEnabled(false);
        }

        int exitCode = paneltalk::EXIT_OK;
        std::thread loopThread([&app, &exitCode] {
            exitCode = app.run();
        });

        tuiApp.run();

        // TUI 被其他方式关闭时（如 Ctrl+C）同样结束中心循环
        app.events().enqueue(paneltalk::UserInput{paneltalk::Key::CtrlQ});
        if (loopThread.joinable()) {
            loopThread.join();
        }

        paneltalk::Logger::instance().setOutputFile("");
        paneltalk::Logger::instance().setEnabled(true);

        if (exitCode == paneltalk::EXIT_SESSION_FAILURE) {
            std::cerr << app.store().status() << std::endl;
        }
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return paneltalk::EXIT_STARTUP_ERROR;
    }
}
