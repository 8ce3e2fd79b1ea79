#include "Logger.h"
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ShaderEmbed::Log {

namespace {

constexpr std::array<LogLevel, 5> ALL_LEVELS = {
    LogLevel::LOG_DEBUG,
    LogLevel::LOG_INFO,
    LogLevel::LOG_WARNING,
    LogLevel::LOG_ERROR,
    LogLevel::LOG_CRITICAL,
};

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

Logger::Logger(std::string name, bool enabled)
    : name_(std::move(name))
    , enabled_(enabled)
{
}

void Logger::AddChild(std::shared_ptr<Logger> child)
{
    if (child) {
        children_.push_back(std::move(child));
    }
}

void Logger::Log(LogLevel level, const std::string& message)
{
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    entries_.push_back(LogEntry{level, CurrentTimestamp(), message});

    if (terminalOutput_) {
        std::ostream& out = outputStream_ ? *outputStream_ : std::clog;
        out << FormatEntry(entries_.back()) << std::endl;
    }
}

std::string Logger::ExtractLogs(int indentLevel) const
{
    const std::string indent(static_cast<size_t>(indentLevel) * 2, ' ');

    std::ostringstream result;
    result << indent << "=== Logger: " << name_ << " ===" << "\n";
    for (const auto& entry : entries_) {
        result << indent << FormatEntry(entry) << "\n";
    }

    for (const auto& child : children_) {
        result << "\n" << child->ExtractLogs(indentLevel + 1);
    }

    return result.str();
}

std::string Logger::FormatEntry(const LogEntry& entry) const
{
    std::ostringstream oss;
    oss << "[" << entry.timestamp << "] "
        << "[" << name_ << "] "
        << "[" << LogLevelToString(entry.level) << "] "
        << entry.message;
    return oss.str();
}

std::string Logger::CurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::LogLevelToString(LogLevel level)
{
    switch (level) {
        case LogLevel::LOG_DEBUG:    return "DEBUG";
        case LogLevel::LOG_INFO:     return "INFO";
        case LogLevel::LOG_WARNING:  return "WARNING";
        case LogLevel::LOG_ERROR:    return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
        default:                     return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::ParseLogLevel(std::string_view text)
{
    for (LogLevel level : ALL_LEVELS) {
        if (EqualsIgnoreCase(text, LogLevelToString(level))) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace ShaderEmbed::Log
