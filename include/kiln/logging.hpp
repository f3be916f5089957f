#pragma once

#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace kiln {

enum class LogLevel { Fine, Info, Warning, Severe };

std::string_view to_string(LogLevel level);

/**
 * @brief Named diagnostics sink.
 *
 * Loggers are created by the caller and passed down; children share the sink,
 * threshold and lock of their parent so output from concurrent tasks does not
 * interleave.
 */
class Logger {
public:
    Logger(std::string name, std::ostream &sink, LogLevel threshold = LogLevel::Info);

    /** @brief Returns a logger writing to the same sink under another name. */
    Logger child(std::string name) const;

    void log(LogLevel level, std::string_view message) const;

    template <typename... Args>
    void fine(std::format_string<Args...> fmt, Args &&...args) const {
        if (enabled(LogLevel::Fine))
            log(LogLevel::Fine, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args) const {
        if (enabled(LogLevel::Info))
            log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args &&...args) const {
        if (enabled(LogLevel::Warning))
            log(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void severe(std::format_string<Args...> fmt, Args &&...args) const {
        log(LogLevel::Severe, std::format(fmt, std::forward<Args>(args)...));
    }

    bool enabled(LogLevel level) const {
        return level >= threshold_;
    }

    const std::string &name() const {
        return name_;
    }

private:
    Logger(std::string name, std::ostream *sink, LogLevel threshold, std::shared_ptr<std::mutex> mtx);

    std::string name_;
    std::ostream *sink_;
    LogLevel threshold_;
    std::shared_ptr<std::mutex> mtx_;
};

/**
 * @brief Runs `fn`, logging when it starts and how long it took.
 * @return Whatever `fn` returns.
 */
template <typename F>
decltype(auto) log_timed(const Logger &logger, std::string_view description, F &&fn) {
    logger.info("{}...", description);
    auto start = std::chrono::steady_clock::now();
    struct Done {
        const Logger &logger;
        std::string_view description;
        std::chrono::steady_clock::time_point start;
        ~Done() {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            logger.info("{} completed, took {}ms", description, ms.count());
        }
    } done{logger, description, start};
    return std::forward<F>(fn)();
}

} // namespace kiln
