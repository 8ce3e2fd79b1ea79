#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ShaderEmbed::Log {

enum class LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL
};

/**
 * @brief One recorded message
 */
struct LogEntry {
    LogLevel level = LogLevel::LOG_INFO;
    std::string timestamp;      // HH:MM:SS.mmm, local time
    std::string message;
};

/**
 * @brief Named, hierarchical logger
 *
 * Entries are kept in memory and extracted together with the entries of
 * every child logger, so a tool can register each component's logger under
 * its own and write one report. Terminal output echoes each accepted entry
 * to a stream (std::clog unless redirected) as it is recorded.
 */
class Logger {
public:
    explicit Logger(std::string name, bool enabled = false);

    void SetEnabled(bool enabled) { enabled_ = enabled; }
    bool IsEnabled() const { return enabled_; }

    void SetTerminalOutput(bool enable) { terminalOutput_ = enable; }
    bool HasTerminalOutput() const { return terminalOutput_; }

    /**
     * @brief Redirect terminal output
     * @param stream Target stream, nullptr restores std::clog
     */
    void SetOutputStream(std::ostream* stream) { outputStream_ = stream; }

    // Entries below this level are dropped
    void SetMinimumLevel(LogLevel level) { minimumLevel_ = level; }
    LogLevel GetMinimumLevel() const { return minimumLevel_; }

    void AddChild(std::shared_ptr<Logger> child);

    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message)    { Log(LogLevel::LOG_DEBUG, message); }
    void Info(const std::string& message)     { Log(LogLevel::LOG_INFO, message); }
    void Warning(const std::string& message)  { Log(LogLevel::LOG_WARNING, message); }
    void Error(const std::string& message)    { Log(LogLevel::LOG_ERROR, message); }
    void Critical(const std::string& message) { Log(LogLevel::LOG_CRITICAL, message); }

    const std::vector<LogEntry>& GetEntries() const { return entries_; }
    size_t GetEntryCount() const { return entries_.size(); }

    /**
     * @brief Render this logger and, indented below it, every child
     */
    std::string ExtractLogs(int indentLevel = 0) const;

    const std::string& GetName() const { return name_; }

    static const char* LogLevelToString(LogLevel level);

    /**
     * @brief Case-insensitive inverse of LogLevelToString
     * @return Level, or nullopt for an unknown name
     */
    static std::optional<LogLevel> ParseLogLevel(std::string_view text);

private:
    std::string FormatEntry(const LogEntry& entry) const;
    static std::string CurrentTimestamp();

    std::string name_;
    bool enabled_;
    bool terminalOutput_ = false;
    LogLevel minimumLevel_ = LogLevel::LOG_DEBUG;
    std::ostream* outputStream_ = nullptr;
    std::vector<std::shared_ptr<Logger>> children_;
    std::vector<LogEntry> entries_;
};

} // namespace ShaderEmbed::Log
