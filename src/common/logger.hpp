#ifndef __LOGGER_HPP__
#define __LOGGER_HPP__

#include <iostream>
#include <iomanip>
#include <string>
#include <sstream>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <atomic>
#include <vector>

namespace passive_kv
{
    enum class LogLevel
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    class Logger
    {
    public:
        static Logger &getInstance()
        {
            static Logger instance;
            return instance;
        }

        void setLevel(LogLevel level) noexcept { _min_level.store(level); }
        LogLevel getLevel() const noexcept { return _min_level.load(); }

        // Accepts "debug", "info", "warn"/"warning" and "error"; anything else is ignored.
        bool setLevel(const std::string &level)
        {
            if (level == "debug")
                setLevel(LogLevel::DEBUG);
            else if (level == "info")
                setLevel(LogLevel::INFO);
            else if (level == "warn" || level == "warning")
                setLevel(LogLevel::WARN);
            else if (level == "error")
                setLevel(LogLevel::ERROR);
            else
                return false;
            return true;
        }

        template <typename... Args>
        void log(LogLevel level, const char *format, Args &&...args)
        {
            if (level < _min_level.load())
            {
                return;
            }

            const auto message = formatString(format, std::forward<Args>(args)...);

            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            std::tm local_tm{};
            localtime_r(&time_t, &local_tm);

            std::ostringstream oss;
            oss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] ";
            oss << "[" << levelToString(level) << "] ";
            oss << message;

            std::lock_guard<std::mutex> lock(_mutex);
            auto &out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << oss.str() << std::endl;
        }

        template <typename... Args>
        void debug(const char *format, Args &&...args)
        {
            log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(const char *format, Args &&...args)
        {
            log(LogLevel::INFO, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const char *format, Args &&...args)
        {
            log(LogLevel::WARN, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(const char *format, Args &&...args)
        {
            log(LogLevel::ERROR, format, std::forward<Args>(args)...);
        }

    private:
        Logger() = default;
        std::mutex _mutex;
        std::atomic<LogLevel> _min_level{LogLevel::INFO};

        static const char *levelToString(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARN:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
            }
        }

        static std::string formatString(const char *format)
        {
            return format;
        }

        // printf-style; callers pass .c_str() for strings
        template <typename... Args>
        static std::string formatString(const char *format, Args &&...args)
        {
            const int size = std::snprintf(nullptr, 0, format, args...);
            if (size < 0)
            {
                return format;
            }

            std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
            std::snprintf(buffer.data(), buffer.size(), format, args...);
            return std::string(buffer.data(), static_cast<std::size_t>(size));
        }
    };

#define LOG_DEBUG(...) ::passive_kv::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::passive_kv::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) ::passive_kv::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::passive_kv::Logger::getInstance().error(__VA_ARGS__)

} // namespace passive_kv

#endif // __LOGGER_HPP__
