#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace TRV {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

constexpr const char *LOGGER_NAME = "TRV";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::mutex &loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::optional<spdlog::level::level_enum> parseLevel(std::string levelName) {
    std::transform(levelName.begin(), levelName.end(), levelName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (levelName == "trace") {
        return spdlog::level::trace;
    } else if (levelName == "debug") {
        return spdlog::level::debug;
    } else if (levelName == "info") {
        return spdlog::level::info;
    } else if (levelName == "warn" || levelName == "warning") {
        return spdlog::level::warn;
    } else if (levelName == "err" || levelName == "error") {
        return spdlog::level::err;
    } else if (levelName == "critical") {
        return spdlog::level::critical;
    } else if (levelName == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

// SPDLOG_LEVEL wins over the built-in default; unknown values fall back to info
spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::info;
    }
    return parseLevel(envLevel).value_or(spdlog::level::info);
}

std::shared_ptr<spdlog::logger> createConsoleLogger() {
    // Reuse a registered logger if a previous instance already claimed the name
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
    logger->set_pattern(CONSOLE_PATTERN);
    return logger;
}

}  // namespace

bool Logger::setLevel(const std::string &levelName) {
    auto level = parseLevel(levelName);
    if (!level) {
        return false;
    }

    TRV_PRIVATE_CALL(ensureLoggerInitialized)();
    std::lock_guard<std::mutex> lock(loggerMutex());
    logger_->set_level(*level);
    return true;
}

std::string Logger::getLevel() {
    TRV_PRIVATE_CALL(ensureLoggerInitialized)();
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto name = spdlog::level::to_string_view(logger_->level());
    return std::string(name.data(), name.size());
}

namespace TRV_LOGGER_PRIVATE_NS {

void ensureLoggerInitialized() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    if (!Logger::logger_) {
        Logger::logger_ = createConsoleLogger();
        Logger::logger_->set_level(levelFromEnvironment());
    }
}

std::string extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    // Return type ends at the last top-level space before the parameter list
    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    ensureLoggerInitialized();
    if (!Logger::logger_->should_log(level)) {
        return;
    }
    Logger::logger_->log(level, extractCleanFunctionName(loc) + "() - " + message);
}

void doInitializeLogger(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    if (Logger::logger_) {
        return;
    }

    if (logDir.empty() || !logToFile) {
        Logger::logger_ = createConsoleLogger();
    } else {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(consoleSink);

        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "trv.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);

        spdlog::drop(LOGGER_NAME);
        Logger::logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(Logger::logger_);
    }

    Logger::logger_->set_level(levelFromEnvironment());
}

}  // namespace TRV_LOGGER_PRIVATE_NS

}  // namespace TRV
