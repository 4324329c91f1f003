#pragma once
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace WebCrawl {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    // Ordered key=value pairs appended to a log line.
    using LogFields = std::vector<std::pair<std::string, std::string>>;

    // Process-wide logger. Lines go to stderr and, after Init(), to
    // <base_dir>/logs/YYYY-MM-DD.log, rotated when the local date changes.
    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel GetMinLevel();
        // Unknown names map to Info.
        static LogLevel FromString(const std::string& s);

        static void Log(LogLevel level, const std::string& message);
        static void Log(LogLevel level, const std::string& message, const LogFields& fields);

    private:
        static void RotateIfNeededUnlocked(const std::tm& now_tm);
        static std::string FormatFields(const LogFields& fields);

        static std::mutex log_mutex;
        static LogLevel min_level_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static std::ofstream file_;
    };
}
