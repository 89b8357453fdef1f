#pragma once

#include <sstream>
#include <functional>
#include <string>

namespace hapdb {

// Our handy stringstream macro
#define SSTR std::ostringstream().flush()

class Logger {
public:
    // Log levels, ordered from most to least verbose
    enum class Level {
        TRACE,
        DEBUG,
        INFO,
        STATUS,
        WARN,
        ERROR,
        FATAL,
        ALWAYS
    };

    // Receives one fully formatted message
    using LogReceiver = std::function<void(const char*)>;

    // Registration
    static void registerTraceReceiver(LogReceiver receiver);
    static void registerDebugReceiver(LogReceiver receiver);
    static void registerInfoReceiver(LogReceiver receiver);
    static void registerStatusReceiver(LogReceiver receiver);
    static void registerWarnReceiver(LogReceiver receiver);
    static void registerErrorReceiver(LogReceiver receiver);
    static void registerFatalReceiver(LogReceiver receiver);
    static void registerAlwaysReceiver(LogReceiver receiver);

    // Drops every registered receiver
    static void clearReceivers();

    // Set global log level. ALWAYS messages ignore the threshold.
    static void setLogLevel(Level level);
    static Level getLogLevel();

    // Case-insensitive level name ("debug", "WARN", ...). Throws std::invalid_argument on unknown names.
    static Level parseLevel(const std::string& name);
    static const char* levelToString(Level level);

    // Logging actions
    static void trace(const char* pText);
    static void trace(const std::string& text);
    static void trace(const std::ostream& text);

    static void debug(const char* pText);
    static void debug(const std::string& text);
    static void debug(const std::ostream& text);

    static void info(const char* pText);
    static void info(const std::string& text);
    static void info(const std::ostream& text);

    static void status(const char* pText);
    static void status(const std::string& text);
    static void status(const std::ostream& text);

    static void warn(const char* pText);
    static void warn(const std::string& text);
    static void warn(const std::ostream& text);

    static void error(const char* pText);
    static void error(const std::string& text);
    static void error(const std::ostream& text);

    static void fatal(const char* pText);
    static void fatal(const std::string& text);
    static void fatal(const std::ostream& text);

    static void always(const char* pText);
    static void always(const std::string& text);
    static void always(const std::ostream& text);

    // Universal log method with level parameter
    static void log(Level level, const std::string& message);

private:
    static constexpr int kLevelCount = static_cast<int>(Level::ALWAYS) + 1;

    static LogReceiver receivers[kLevelCount];
    static Level currentLogLevel;

    static bool shouldLog(Level messageLevel);
    static void dispatch(Level level, const char* pText);
};

} // namespace hapdb
