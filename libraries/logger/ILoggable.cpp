#include "ILoggable.h"
#include "Logger.h"

namespace ShaderEmbed::Log {

void ILoggable::InitializeLogger(const std::string& subsystemName, bool enabled) {
    logger = std::make_shared<Logger>(subsystemName, enabled);
}

void ILoggable::RegisterToParentLogger(Logger& parentLogger) {
    if (logger) {
        parentLogger.AddChild(logger);
    }
}

void ILoggable::SetLoggerEnabled(bool enabled) {
    if (logger) {
        logger->SetEnabled(enabled);
    }
}

void ILoggable::SetLoggerTerminalOutput(bool enabled) {
    if (logger) {
        logger->SetTerminalOutput(enabled);
    }
}

} // namespace ShaderEmbed::Log
