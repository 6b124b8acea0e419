// src/common/utils/logger/Logger.hpp
#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <memory>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifndef DEVSECRETS_COMPILE_LOG_LEVEL
    #ifdef NDEBUG
        #define DEVSECRETS_COMPILE_LOG_LEVEL 3  // Release: ERROR 이상만
    #else
        #define DEVSECRETS_COMPILE_LOG_LEVEL 0  // Debug: 모든 로그
    #endif
#endif

namespace devsecrets::utils {

enum class LogLevel : int {
    DEBUG = 0,  // 개발 디버깅
    INFO = 1,   // 주요 이벤트
    WARN = 2,   // 경고
    ERROR = 3,  // 오류
    FATAL = 4,  // 치명적 오류
    NONE = 5    // 로그 비활성화
};

/**
 * @brief 프로세스 전역 로거
 *
 * 콘솔 출력은 전부 stderr 로 보낸다.
 * stdout 은 CLI 명령 결과(path 출력 등) 전용.
 */
class Logger {
private:
    inline static std::unique_ptr<Logger> instance = nullptr;
    inline static std::mutex instance_mutex;

    LogLevel min_level = LogLevel::INFO;
    std::mutex log_mutex;
    std::ofstream file;
    bool console_enabled = true;
    bool file_enabled = false;

    Logger() = default;

    static const char* LogLevelToString(LogLevel level) {
        switch(level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKN ";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

public:
    static Logger& Instance() {
        std::lock_guard<std::mutex> lock(instance_mutex);
        if (!instance) {
            instance.reset(new Logger());
        }
        return *instance;
    }

    static LogLevel StringToLogLevel(const char* str) {
        if (!str) return LogLevel::INFO;

        std::string level_str(str);
        for (char& c : level_str) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (level_str == "DEBUG" || level_str == "0") return LogLevel::DEBUG;
        if (level_str == "INFO"  || level_str == "1") return LogLevel::INFO;
        if (level_str == "WARN"  || level_str == "2") return LogLevel::WARN;
        if (level_str == "ERROR" || level_str == "3") return LogLevel::ERROR;
        if (level_str == "FATAL" || level_str == "4") return LogLevel::FATAL;
        if (level_str == "NONE"  || level_str == "5") return LogLevel::NONE;

        return LogLevel::INFO;
    }

    /**
     * @brief 로거 초기화
     * @param log_file 로그 파일 경로 (nullptr 이면 파일 로그 없음)
     * @param enable_console stderr 출력 여부
     * @param runtime_level 최소 레벨 문자열. nullptr 이면 DEVSECRETS_LOG_LEVEL 환경 변수 사용
     */
    void Initialize(const char* log_file = nullptr, bool enable_console = true,
                    const char* runtime_level = nullptr) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_enabled = enable_console;

        if (file.is_open()) {
            file.close();
            file_enabled = false;
        }
        if (log_file && *log_file) {
            file.open(log_file, std::ios::app);
            file_enabled = file.is_open();
            if (!file_enabled) {
                std::cerr << "[Logger] Warning: cannot open log file " << log_file << std::endl;
            }
        }

        if (!runtime_level) {
            runtime_level = std::getenv("DEVSECRETS_LOG_LEVEL");
        }

        if (runtime_level && *runtime_level) {
            LogLevel requested_level = StringToLogLevel(runtime_level);

            if (static_cast<int>(requested_level) < DEVSECRETS_COMPILE_LOG_LEVEL) {
                std::cerr << "[Logger] Warning: DEVSECRETS_LOG_LEVEL("
                         << static_cast<int>(requested_level)
                         << ") < DEVSECRETS_COMPILE_LOG_LEVEL(" << DEVSECRETS_COMPILE_LOG_LEVEL
                         << "). Using DEVSECRETS_COMPILE_LOG_LEVEL." << std::endl;
                min_level = static_cast<LogLevel>(DEVSECRETS_COMPILE_LOG_LEVEL);
            } else {
                min_level = requested_level;
            }
        } else {
            min_level = LogLevel::INFO;
        }
    }

    LogLevel GetMinLevel() const {
        return min_level;
    }

    void Log(LogLevel level, const char* category, const char* message) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        std::string log_line = GetTimestamp() + " [" + LogLevelToString(level) + "] " +
                               "[" + category + "] " + message + "\n";

        std::lock_guard<std::mutex> lock(log_mutex);

        if (console_enabled) {
            std::cerr << log_line;
        }

        if (file_enabled && file.is_open()) {
            file << log_line;
            if (level >= LogLevel::ERROR) {
                file.flush();
            }
        }
    }

    void Logf(LogLevel level, const char* category, const char* format, ...) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        char buffer[4096];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        Log(level, category, buffer);
    }

    ~Logger() {
        if (file.is_open()) {
            file.close();
        }
    }
};

} // namespace devsecrets::utils

// ========================================
// 컴파일 타임 로그 제거 매크로
// ========================================

#define DEVSECRETS_LOG_IMPL(level, cat, msg) \
    devsecrets::utils::Logger::Instance().Log(devsecrets::utils::LogLevel::level, cat, msg)

#define DEVSECRETS_LOG_IMPLF(level, cat, fmt, ...) \
    devsecrets::utils::Logger::Instance().Logf(devsecrets::utils::LogLevel::level, cat, fmt, ##__VA_ARGS__)

// DEBUG (DEVSECRETS_COMPILE_LOG_LEVEL <= 0)
#if DEVSECRETS_COMPILE_LOG_LEVEL <= 0
    #define DEVSECRETS_LOG_DEBUG(cat, msg) DEVSECRETS_LOG_IMPL(DEBUG, cat, msg)
    #define DEVSECRETS_LOG_DEBUGF(cat, fmt, ...) DEVSECRETS_LOG_IMPLF(DEBUG, cat, fmt, ##__VA_ARGS__)
#else
    #define DEVSECRETS_LOG_DEBUG(cat, msg) ((void)0)
    #define DEVSECRETS_LOG_DEBUGF(cat, fmt, ...) ((void)0)
#endif

// INFO (DEVSECRETS_COMPILE_LOG_LEVEL <= 1)
#if DEVSECRETS_COMPILE_LOG_LEVEL <= 1
    #define DEVSECRETS_LOG_INFO(cat, msg) DEVSECRETS_LOG_IMPL(INFO, cat, msg)
    #define DEVSECRETS_LOG_INFOF(cat, fmt, ...) DEVSECRETS_LOG_IMPLF(INFO, cat, fmt, ##__VA_ARGS__)
#else
    #define DEVSECRETS_LOG_INFO(cat, msg) ((void)0)
    #define DEVSECRETS_LOG_INFOF(cat, fmt, ...) ((void)0)
#endif

// WARN (DEVSECRETS_COMPILE_LOG_LEVEL <= 2)
#if DEVSECRETS_COMPILE_LOG_LEVEL <= 2
    #define DEVSECRETS_LOG_WARN(cat, msg) DEVSECRETS_LOG_IMPL(WARN, cat, msg)
    #define DEVSECRETS_LOG_WARNF(cat, fmt, ...) DEVSECRETS_LOG_IMPLF(WARN, cat, fmt, ##__VA_ARGS__)
#else
    #define DEVSECRETS_LOG_WARN(cat, msg) ((void)0)
    #define DEVSECRETS_LOG_WARNF(cat, fmt, ...) ((void)0)
#endif

// ERROR (DEVSECRETS_COMPILE_LOG_LEVEL <= 3)
#if DEVSECRETS_COMPILE_LOG_LEVEL <= 3
    #define DEVSECRETS_LOG_ERROR(cat, msg) DEVSECRETS_LOG_IMPL(ERROR, cat, msg)
    #define DEVSECRETS_LOG_ERRORF(cat, fmt, ...) DEVSECRETS_LOG_IMPLF(ERROR, cat, fmt, ##__VA_ARGS__)
#else
    #define DEVSECRETS_LOG_ERROR(cat, msg) ((void)0)
    #define DEVSECRETS_LOG_ERRORF(cat, fmt, ...) ((void)0)
#endif

// FATAL (DEVSECRETS_COMPILE_LOG_LEVEL <= 4)
#if DEVSECRETS_COMPILE_LOG_LEVEL <= 4
    #define DEVSECRETS_LOG_FATAL(cat, msg) DEVSECRETS_LOG_IMPL(FATAL, cat, msg)
    #define DEVSECRETS_LOG_FATALF(cat, fmt, ...) DEVSECRETS_LOG_IMPLF(FATAL, cat, fmt, ##__VA_ARGS__)
#else
    #define DEVSECRETS_LOG_FATAL(cat, msg) ((void)0)
    #define DEVSECRETS_LOG_FATALF(cat, fmt, ...) ((void)0)
#endif
