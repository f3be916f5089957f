#include "kiln/logging.hpp"

#include <print>

namespace kiln {

std::string_view to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Fine:
        return "FINE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Severe:
        return "SEVERE";
    }
    return "UNKNOWN";
}

Logger::Logger(std::string name, std::ostream &sink, LogLevel threshold)
    : Logger(std::move(name), &sink, threshold, std::make_shared<std::mutex>()) {
}

Logger::Logger(std::string name, std::ostream *sink, LogLevel threshold, std::shared_ptr<std::mutex> mtx)
    : name_(std::move(name)), sink_(sink), threshold_(threshold), mtx_(std::move(mtx)) {
}

Logger Logger::child(std::string name) const {
    return Logger(std::move(name), sink_, threshold_, mtx_);
}

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard lock(*mtx_);
    std::println(*sink_, "[{}] {}: {}", to_string(level), name_, message);
}

} // namespace kiln
