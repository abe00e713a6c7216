#pragma once

#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

#define TRV_LOGGER_PRIVATE_NS __detail
#define TRV_PRIVATE_CALL(func) TRV_LOGGER_PRIVATE_NS::func

namespace TRV {

namespace TRV_LOGGER_PRIVATE_NS {
void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc);
void doInitializeLogger(const std::string &logDir, bool logToFile);
std::string extractCleanFunctionName(const std::source_location &loc);
void ensureLoggerInitialized();
}  // namespace TRV_LOGGER_PRIVATE_NS

/**
 * @brief Process-wide logging facade over spdlog
 *
 * The logger is created lazily on first use (console sink) unless
 * initialize() was called before. Log level comes from SPDLOG_LEVEL or
 * from setLevel().
 */
class Logger {
public:
    static void initialize() {
        TRV_PRIVATE_CALL(doInitializeLogger)("", false);
    }

    /**
     * @brief Initialize with an additional file sink (<logDir>/trv.log)
     */
    static void initialize(const std::string &logDir, bool logToFile = true) {
        TRV_PRIVATE_CALL(doInitializeLogger)(logDir, logToFile);
    }

    /**
     * @brief Change the active level
     * @param levelName trace, debug, info, warn, error, critical or off
     * @return false if the name is not a known level (level unchanged)
     */
    static bool setLevel(const std::string &levelName);

    /**
     * @brief Name of the active level, as accepted by setLevel()
     */
    static std::string getLevel();

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TRV_PRIVATE_CALL(doFormatAndLog)(spdlog::level::trace, message, loc);
    }

    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TRV_PRIVATE_CALL(doFormatAndLog)(spdlog::level::debug, message, loc);
    }

    static void info(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TRV_PRIVATE_CALL(doFormatAndLog)(spdlog::level::info, message, loc);
    }

    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TRV_PRIVATE_CALL(doFormatAndLog)(spdlog::level::warn, message, loc);
    }

    static void error(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TRV_PRIVATE_CALL(doFormatAndLog)(spdlog::level::err, message, loc);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;

    friend void TRV_LOGGER_PRIVATE_NS::ensureLoggerInitialized();
    friend void TRV_LOGGER_PRIVATE_NS::doFormatAndLog(spdlog::level::level_enum level, const std::string &message,
                                                      const std::source_location &loc);
    friend void TRV_LOGGER_PRIVATE_NS::doInitializeLogger(const std::string &logDir, bool logToFile);
};

}  // namespace TRV

#define LOG_TRACE(...) TRV::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) TRV::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) TRV::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) TRV::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) TRV::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
