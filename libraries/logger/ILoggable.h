#pragma once

#include <memory>
#include <string>
#include "Logger.h"

/**
 * @brief Logging macros for ILoggable-derived classes
 *
 * The logger may not exist yet; the macros check before calling.
 */
#define LOG_DEBUG(msg)   do { if (auto* log = GetLogger()) { log->Debug(msg); } } while(0)
#define LOG_INFO(msg)    do { if (auto* log = GetLogger()) { log->Info(msg); } } while(0)
#define LOG_WARNING(msg) do { if (auto* log = GetLogger()) { log->Warning(msg); } } while(0)
#define LOG_ERROR(msg)   do { if (auto* log = GetLogger()) { log->Error(msg); } } while(0)

namespace ShaderEmbed::Log {

/**
 * @brief Mixin for components that own a named logger
 *
 * Usage pattern:
 * @code
 * class CompilationRun : public ILoggable {
 * public:
 *     CompilationRun() { InitializeLogger("CompilationRun"); }
 *
 *     void Visit(const std::filesystem::path& p) {
 *         LOG_DEBUG("Visiting " + p.string());
 *     }
 * };
 * @endcode
 */
class ILoggable {
public:
    virtual ~ILoggable() = default;

    /**
     * @brief Get the component's logger
     * @return Logger pointer (nullptr if not initialized)
     */
    Logger* GetLogger() const { return logger.get(); }

    /**
     * @brief Register this component's logger as a child of a parent logger
     *
     * The parent shares ownership, so its report outlives the component.
     */
    void RegisterToParentLogger(Logger& parentLogger);

    void SetLoggerEnabled(bool enabled);
    void SetLoggerTerminalOutput(bool enabled);

protected:
    /**
     * @brief Create the logger; call from the derived constructor
     * @param subsystemName Logger name shown in every entry
     * @param enabled Initial enabled state
     */
    void InitializeLogger(const std::string& subsystemName, bool enabled = false);

private:
    std::shared_ptr<Logger> logger;
};

} // namespace ShaderEmbed::Log
