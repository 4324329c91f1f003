#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace WebCrawl {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};
std::ofstream Logger::file_{};

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::tm LocalTime(std::time_t t) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
    return out;
}

bool NeedsQuoting(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

} // anonymous namespace

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = min_level;
    if (file_.is_open()) file_.close();
    current_date_.clear();

    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logs_dir_.string() << ": " << ec.message()
                  << ", logging to console only" << std::endl;
        logs_dir_.clear();
    }
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

LogLevel Logger::GetMinLevel() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level_;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back(static_cast<char>(std::tolower(c)));
    if (t == "debug") return LogLevel::Debug;
    if (t == "warn" || t == "warning") return LogLevel::Warn;
    if (t == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::RotateIfNeededUnlocked(const std::tm& now_tm) {
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &now_tm);
    if (current_date_ == date && file_.is_open()) return;

    current_date_ = date;
    if (file_.is_open()) file_.close();
    file_.open(logs_dir_ / (current_date_ + ".log"), std::ios::out | std::ios::app);
}

std::string Logger::FormatFields(const LogFields& fields) {
    std::string out;
    for (const auto& kv : fields) {
        out += ' ';
        out += kv.first;
        out += '=';
        if (!NeedsQuoting(kv.second)) {
            out += kv.second;
            continue;
        }
        out += '"';
        for (char c : kv.second) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    return out;
}

void Logger::Log(LogLevel level, const std::string& message) {
    Log(level, message, LogFields{});
}

void Logger::Log(LogLevel level, const std::string& message, const LogFields& fields) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;

    const std::tm now_tm = LocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::ostringstream line;
    line << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << ' ' << LevelName(level) << ' '
         << message << FormatFields(fields);

    // stdout is left to the crawl summary
    std::cerr << line.str() << std::endl;

    if (logs_dir_.empty()) return;
    RotateIfNeededUnlocked(now_tm);
    if (file_.is_open()) {
        file_ << line.str() << std::endl;
    }
}

}
