#include <relay/util/logging.h>

#include <iostream>

namespace relay {
    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
        }
        return "UNKNOWN";
    }

    StreamLogger::StreamLogger(std::string name, LogLevel level)
        : StreamLogger(std::cerr, std::move(name), level) {
    }

    StreamLogger::StreamLogger(std::ostream &stream, std::string name, LogLevel level)
        : _stream{stream}, _name{std::move(name)}, _level{level} {
    }

    bool StreamLogger::enabled(LogLevel level) const { return level >= _level; }

    void StreamLogger::write(LogLevel level, std::string_view message) {
        std::lock_guard guard(_lock);
        _stream << fmt::format("[{}] {}: {}", to_string(level), _name, message) << std::endl;
    }

    LogLevel StreamLogger::level() const { return _level; }

    void StreamLogger::set_level(LogLevel level) { _level = level; }

    const std::string &StreamLogger::name() const { return _name; }

    Logger::ptr null_logger() {
        static const auto logger = std::make_shared<NullLogger>();
        return logger;
    }
} // namespace relay
