#pragma once
#include <format>

namespace ytassist::logging {

// One unique entry for each warn or error log event
enum class LogEvent {
    LE_IOTHREAD_THREW               = 0x0001,
    LE_DATABASE_ROLLBACK_FAILED     = 0x0002,
    LE_API_REQUEST_FAILED           = 0x0003,
    LE_DATABASE_WRONG_VERSION       = 0x0004,
    LE_DATABASE_UNAVAILABLE         = 0x0005,
};

} // ns

namespace ytassist {
class RequestCtx;
}

namespace logfault {
    std::pair<bool /* json */, std::string /* content or json */> toLog(const ytassist::RequestCtx& ctx, bool json);
}

#define LOGFAULT_USE_TID_AS_NAME 1

#include "logfault/logfault.h"

#define LOG_ERROR   LFLOG_ERROR
#define LOG_WARN    LFLOG_WARN
#define LOG_INFO    LFLOG_INFO
#define LOG_DEBUG   LFLOG_DEBUG
#define LOG_TRACE   LFLOG_TRACE

#define LOG_ERROR_N   LFLOG_ERROR_EX
#define LOG_WARN_N    LFLOG_WARN_EX
#define LOG_INFO_N    LFLOG_INFO_EX
#define LOG_DEBUG_N   LFLOG_DEBUG_EX
#define LOG_TRACE_N   LFLOG_TRACE_EX

#define LOG_ERROR_EX(...)   LOGFAULT_LOG_EX__(logfault::LogLevel::ERROR __VA_OPT__(, __VA_ARGS__))
#define LOG_WARN_EX(...)    LOGFAULT_LOG_EX__(logfault::LogLevel::WARN __VA_OPT__(, __VA_ARGS__))
#define LOG_INFO_EX(...)    LOGFAULT_LOG_EX__(logfault::LogLevel::INFO __VA_OPT__(, __VA_ARGS__))
#define LOG_DEBUG_EX(...)   LOGFAULT_LOG_EX__(logfault::LogLevel::DEBUGGING __VA_OPT__(, __VA_ARGS__))
#define LOG_TRACE_EX(...)   LOGFAULT_LOG_EX__(logfault::LogLevel::TRACE __VA_OPT__(, __VA_ARGS__))

inline std::ostream& operator << (std::ostream& out, const ::ytassist::logging::LogEvent ev) {
    return out << std::format("lid={:0>4x} ", static_cast<uint32_t>(ev));
}
