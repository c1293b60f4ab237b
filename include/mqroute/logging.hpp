/**
 * @file logging.hpp
 * @brief Optional logging façade shared by every mqroute component.
 *
 * Unless the build defines `MQROUTE_USE_QUILL` the log‑macros expand to
 * no‑ops, keeping the entire logging path out of the binary.
 */

#pragma once

#include <string>

#ifdef MQROUTE_USE_QUILL
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>

#define MQROUTE_LOG_INFO(...) LOG_INFO(__VA_ARGS__)
#define MQROUTE_LOG_DEBUG(...) LOG_DEBUG(__VA_ARGS__)
#define MQROUTE_LOG_WARNING(...) LOG_WARNING(__VA_ARGS__)
#define MQROUTE_LOG_ERROR(...) LOG_ERROR(__VA_ARGS__)
#define MQROUTE_LOG_CRITICAL(...) LOG_CRITICAL(__VA_ARGS__)

namespace mqroute::logging {
using level = quill::LogLevel; ///< Logging level alias.
using Logger = quill::Logger*; ///< Loggers are owned by the quill frontend.

/**
 * @brief Create (or fetch) a console backed logger.
 * @param name Unique name – logger instances are cached by the backend.
 */
inline Logger create_logger(const std::string& name) {
    return quill::Frontend::create_or_get_logger(
        "mqroute." + name,
        quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
            "mqroute_console"));
}

/// Start the dedicated Quill backend thread. Call once per process.
inline void start_backend() { quill::Backend::start(); }

/// Set a runtime log level on a logger returned by @ref create_logger.
inline void set_log_level(Logger logger, level log_level) {
    logger->set_log_level(log_level);
}
} // namespace mqroute::logging
#else
#define MQROUTE_LOG_INFO(...)
#define MQROUTE_LOG_DEBUG(...)
#define MQROUTE_LOG_WARNING(...)
#define MQROUTE_LOG_ERROR(...)
#define MQROUTE_LOG_CRITICAL(...)

namespace mqroute::logging {
/// Log levels used in the code base when quill is compiled out.
enum class level { Info, Debug, Warning, Error, Critical };
using Logger = void*; ///< Never dereferenced.
inline Logger create_logger(const std::string&) { return nullptr; }
inline void start_backend() {}
inline void set_log_level(Logger, level) {}
} // namespace mqroute::logging
#endif // MQROUTE_USE_QUILL
