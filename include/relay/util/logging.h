#ifndef RELAY_UTIL_LOGGING_H
#define RELAY_UTIL_LOGGING_H

#include <relay/relay_base.h>

#include <iosfwd>
#include <memory>
#include <mutex>

namespace relay {
    enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

    [[nodiscard]] RELAY_EXPORT std::string_view to_string(LogLevel level);

    /**
     * Destination for messages produced by the observer machinery.
     *
     * Implementations only need to provide ``write``, the formatting helpers produce the message with fmt and skip the
     * formatting work entirely when the level is not enabled.
     */
    struct RELAY_EXPORT Logger {
        using ptr = logger_ptr;

        virtual ~Logger() = default;

        [[nodiscard]] virtual bool enabled(LogLevel level) const = 0;

        virtual void write(LogLevel level, std::string_view message) = 0;

        template<typename... Ts>
        void log(LogLevel level, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            if (enabled(level)) { write(level, fmt::format(fmt_str, std::forward<Ts>(xs)...)); }
        }

        template<typename... Ts>
        void debug(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            log(LogLevel::DEBUG, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void info(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            log(LogLevel::INFO, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void warning(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            log(LogLevel::WARNING, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            log(LogLevel::ERROR, fmt_str, std::forward<Ts>(xs)...);
        }
    };

    /**
     * Writes one ``[LEVEL] name: message`` line per message to a stream (stderr by default).
     */
    class RELAY_EXPORT StreamLogger : public Logger {
    public:
        explicit StreamLogger(std::string name = "relay", LogLevel level = LogLevel::INFO);

        StreamLogger(std::ostream &stream, std::string name, LogLevel level = LogLevel::INFO);

        [[nodiscard]] bool enabled(LogLevel level) const override;

        void write(LogLevel level, std::string_view message) override;

        [[nodiscard]] LogLevel level() const;

        void set_level(LogLevel level);

        [[nodiscard]] const std::string &name() const;

    private:
        std::ostream &_stream;
        std::string _name;
        LogLevel _level;
        std::mutex _lock;
    };

    /**
     * Drops all messages. Used when no logger is supplied.
     */
    struct RELAY_EXPORT NullLogger : Logger {
        [[nodiscard]] bool enabled(LogLevel) const override { return false; }

        void write(LogLevel, std::string_view) override {}
    };

    [[nodiscard]] RELAY_EXPORT Logger::ptr null_logger();
} // namespace relay

#endif // RELAY_UTIL_LOGGING_H
