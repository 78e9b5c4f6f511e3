/**
 * @file logger.hpp
 * @brief 线程安全的日志输出工具
 *
 * 提供简洁的流式日志接口，确保多线程环境下每行日志完整输出。
 * 全屏 TUI 运行期间终端被占用，可关闭输出或改写到日志文件。
 */

#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace paneltalk {

/**
 * @class Logger
 * @brief 线程安全的日志输出器（单例模式）
 *
 * 使用 POSIX write() 系统调用保证单行原子写入。
 *
 * @par 使用示例
 * @code
 * LOG() << "[PaneApp] Applied event, version=" << version;
 * @endcode
 *
 * @note 日志会自动在末尾添加换行符
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    ~Logger() {
        closeFile();
    }

    /**
     * @class LogStream
     * @brief 日志流对象，析构时整行写出
     */
    class LogStream {
    public:
        explicit LogStream(Logger& owner) : owner_(owner) {}

        ~LogStream() {
            if (!owner_.enabled_.load()) {
                return;
            }
            buffer_ << '\n';
            owner_.write(buffer_.str());
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        LogStream(LogStream&& other) noexcept
            : owner_(other.owner_), buffer_(std::move(other.buffer_)) {}

        template<typename T>
        LogStream& operator<<(const T& value) {
            buffer_ << value;
            return *this;
        }

    private:
        Logger& owner_;
        std::ostringstream buffer_;
    };

    LogStream log() {
        return LogStream(*this);
    }

    /**
     * @brief 启用/关闭日志输出
     *
     * TUI 接管终端时关闭，避免日志破坏画面。
     */
    void setEnabled(bool enabled) {
        enabled_.store(enabled);
    }

    bool isEnabled() const {
        return enabled_.load();
    }

    /**
     * @brief 将日志改写到文件（追加模式）
     * @param path 文件路径，空字符串表示恢复到标准输出
     * @return false 文件无法打开，输出目标保持不变
     */
    bool setOutputFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path.empty()) {
            closeFileLocked();
            fd_ = STDOUT_FILENO;
            return true;
        }
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0) {
            return false;
        }
        closeFileLocked();
        fd_ = fd;
        return true;
    }

    /// 当前是否写入文件（而非标准输出）
    bool writesToFile() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fd_ != STDOUT_FILENO;
    }

private:
    Logger() = default;

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        // 单次 write() 是原子的
        ssize_t n = ::write(fd_, line.c_str(), line.size());
        (void)n;
    }

    void closeFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        closeFileLocked();
    }

    void closeFileLocked() {
        if (fd_ != STDOUT_FILENO) {
            ::close(fd_);
            fd_ = STDOUT_FILENO;
        }
    }

    mutable std::mutex mutex_;
    std::atomic<bool> enabled_{true};
    int fd_ = STDOUT_FILENO;
};

/**
 * @def LOG()
 * @brief 日志输出宏
 *
 * 使用方式：LOG() << "message" << value;
 */
#define LOG() paneltalk::Logger::instance().log()

} // namespace paneltalk
