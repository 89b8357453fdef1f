#include "Logger.h"
#include "Utils.h"

#include <stdexcept>

namespace hapdb {

// Initialize static members
Logger::LogReceiver Logger::receivers[Logger::kLevelCount];
Logger::Level Logger::currentLogLevel = Logger::Level::INFO;

//
// Registration
//

void Logger::registerTraceReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::TRACE)] = receiver; }
void Logger::registerDebugReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::DEBUG)] = receiver; }
void Logger::registerInfoReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::INFO)] = receiver; }
void Logger::registerStatusReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::STATUS)] = receiver; }
void Logger::registerWarnReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::WARN)] = receiver; }
void Logger::registerErrorReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::ERROR)] = receiver; }
void Logger::registerFatalReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::FATAL)] = receiver; }
void Logger::registerAlwaysReceiver(LogReceiver receiver) { receivers[static_cast<int>(Level::ALWAYS)] = receiver; }

void Logger::clearReceivers() {
    for (auto& receiver : receivers) {
        receiver = nullptr;
    }
}

void Logger::setLogLevel(Level level) {
    currentLogLevel = level;
}

Logger::Level Logger::getLogLevel() {
    return currentLogLevel;
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string upper = Utils::toUpper(Utils::trim(name));

    for (int i = 0; i < kLevelCount; ++i) {
        Level level = static_cast<Level>(i);
        if (upper == levelToString(level)) {
            return level;
        }
    }

    // Common alias
    if (upper == "WARNING") {
        return Level::WARN;
    }

    throw std::invalid_argument("Unknown log level: " + name);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::STATUS: return "STATUS";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
        case Level::ALWAYS: return "ALWAYS";
        default: return "UNKNOWN";
    }
}

bool Logger::shouldLog(Level messageLevel) {
    if (messageLevel == Level::ALWAYS) {
        return true;
    }
    return static_cast<int>(messageLevel) >= static_cast<int>(currentLogLevel);
}

void Logger::dispatch(Level level, const char* pText) {
    if (!shouldLog(level)) {
        return;
    }

    const LogReceiver& receiver = receivers[static_cast<int>(level)];
    if (receiver) {
        receiver(pText);
    }
}

//
// Logging actions
//

void Logger::log(Level level, const std::string& message) {
    dispatch(level, message.c_str());
}

void Logger::trace(const char* pText) { dispatch(Level::TRACE, pText); }
void Logger::trace(const std::string& text) { dispatch(Level::TRACE, text.c_str()); }
void Logger::trace(const std::ostream& text) {
    if (shouldLog(Level::TRACE)) {
        dispatch(Level::TRACE, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::debug(const char* pText) { dispatch(Level::DEBUG, pText); }
void Logger::debug(const std::string& text) { dispatch(Level::DEBUG, text.c_str()); }
void Logger::debug(const std::ostream& text) {
    if (shouldLog(Level::DEBUG)) {
        dispatch(Level::DEBUG, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::info(const char* pText) { dispatch(Level::INFO, pText); }
void Logger::info(const std::string& text) { dispatch(Level::INFO, text.c_str()); }
void Logger::info(const std::ostream& text) {
    if (shouldLog(Level::INFO)) {
        dispatch(Level::INFO, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::status(const char* pText) { dispatch(Level::STATUS, pText); }
void Logger::status(const std::string& text) { dispatch(Level::STATUS, text.c_str()); }
void Logger::status(const std::ostream& text) {
    if (shouldLog(Level::STATUS)) {
        dispatch(Level::STATUS, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::warn(const char* pText) { dispatch(Level::WARN, pText); }
void Logger::warn(const std::string& text) { dispatch(Level::WARN, text.c_str()); }
void Logger::warn(const std::ostream& text) {
    if (shouldLog(Level::WARN)) {
        dispatch(Level::WARN, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::error(const char* pText) { dispatch(Level::ERROR, pText); }
void Logger::error(const std::string& text) { dispatch(Level::ERROR, text.c_str()); }
void Logger::error(const std::ostream& text) {
    if (shouldLog(Level::ERROR)) {
        dispatch(Level::ERROR, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::fatal(const char* pText) { dispatch(Level::FATAL, pText); }
void Logger::fatal(const std::string& text) { dispatch(Level::FATAL, text.c_str()); }
void Logger::fatal(const std::ostream& text) {
    if (shouldLog(Level::FATAL)) {
        dispatch(Level::FATAL, static_cast<const std::ostringstream&>(text).str().c_str());
    }
}

void Logger::always(const char* pText) { dispatch(Level::ALWAYS, pText); }
void Logger::always(const std::string& text) { dispatch(Level::ALWAYS, text.c_str()); }
void Logger::always(const std::ostream& text) {
    dispatch(Level::ALWAYS, static_cast<const std::ostringstream&>(text).str().c_str());
}

} // namespace hapdb
