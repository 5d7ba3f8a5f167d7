#pragma once
/// @file Log.hpp
/// @brief Leveled diagnostic logging to stderr

#include <sstream>
#include <string>

namespace ContactStore {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

/// @brief Current threshold. Initialized from CONTACTSTORE_LOG_LEVEL on first use.
Level level() noexcept;

void setLevel(Level lvl) noexcept;

/// @brief Parses "debug", "info", "warn", "error" or "off" (case-insensitive)
/// @return false if the name is unknown, out is left unchanged
bool parseLevel(const std::string& name, Level& out);

inline bool enabled(Level lvl) noexcept { return lvl >= level() && lvl != Level::Off; }

/// @brief Writes one line "[contactstore] LEVEL: message" to stderr
void write(Level lvl, const std::string& message);

} // namespace log
} // namespace ContactStore

#define CONTACTSTORE_LOG(lvl, expr)                                                            \
    do {                                                                                       \
        if (::ContactStore::log::enabled(lvl)) {                                               \
            std::ostringstream contactstore_log_oss_;                                          \
            contactstore_log_oss_ << expr;                                                     \
            ::ContactStore::log::write(lvl, contactstore_log_oss_.str());                      \
        }                                                                                      \
    } while (0)

#define CONTACTSTORE_LOG_DEBUG(expr) CONTACTSTORE_LOG(::ContactStore::log::Level::Debug, expr)
#define CONTACTSTORE_LOG_INFO(expr) CONTACTSTORE_LOG(::ContactStore::log::Level::Info, expr)
#define CONTACTSTORE_LOG_WARN(expr) CONTACTSTORE_LOG(::ContactStore::log::Level::Warn, expr)
#define CONTACTSTORE_LOG_ERROR(expr) CONTACTSTORE_LOG(::ContactStore::log::Level::Error, expr)
