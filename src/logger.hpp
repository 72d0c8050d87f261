#pragma once

#include <atomic>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace execmetrics {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warning = 2, Error = 3 };

[[nodiscard]] inline const char* toString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

// "debug", "INFO", "Warning"... nullopt when unrecognised
[[nodiscard]] inline std::optional<LogLevel> parseLogLevel(std::string name)
{
    for (auto& c : name) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (name == "DEBUG")
        return LogLevel::Debug;
    if (name == "INFO")
        return LogLevel::Info;
    if (name == "WARNING" || name == "WARN")
        return LogLevel::Warning;
    if (name == "ERROR")
        return LogLevel::Error;
    return std::nullopt;
}

// Process-wide console logger: "LEVEL: message", errors to stderr
class Logger {
public:
    static Logger& instance()
    {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) { m_level = level; }

    [[nodiscard]] LogLevel level() const { return m_level; }

    // Redirect output (nullptr restores stdout/stderr)
    void setStream(std::ostream* stream)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stream = stream;
    }

    template <typename... Args>
    void log(LogLevel level, Args&&... args)
    {
        if (level < m_level) {
            return;
        }

        std::ostringstream line;
        line << toString(level) << ": ";
        (line << ... << args);

        std::lock_guard<std::mutex> lock(m_mutex);
        std::ostream& out = m_stream != nullptr ? *m_stream : (level >= LogLevel::Error ? std::cerr : std::cout);
        out << line.str() << std::endl;
    }

    template <typename... Args>
    void debug(Args&&... args)
    {
        log(LogLevel::Debug, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args)
    {
        log(LogLevel::Info, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warning(Args&&... args)
    {
        log(LogLevel::Warning, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args)
    {
        log(LogLevel::Error, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    std::atomic<LogLevel> m_level{LogLevel::Info};
    std::ostream* m_stream = nullptr;
    std::mutex m_mutex;
};

} // namespace execmetrics
