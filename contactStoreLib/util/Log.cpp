/// @file Log.cpp
/// @brief stderr sink and level handling for the diagnostic logger

#include <contactstore/util/Log.hpp>
#include <contactstore/util/textUtil.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace ContactStore {
namespace log {

namespace {

Level initialLevel() {
    Level lvl = Level::Warn;
    if (const char* env = std::getenv("CONTACTSTORE_LOG_LEVEL"))
        parseLevel(env, lvl);
    return lvl;
}

std::atomic<int>& levelStorage() {
    static std::atomic<int> stored{static_cast<int>(initialLevel())};
    return stored;
}

const char* levelName(Level lvl) {
    switch (lvl) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "OFF";
}

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

} // namespace

Level level() noexcept { return static_cast<Level>(levelStorage().load(std::memory_order_relaxed)); }

void setLevel(Level lvl) noexcept {
    levelStorage().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

bool parseLevel(const std::string& name, Level& out) {
    const std::string n = util::toLowerAscii(util::trim(name));
    if (n == "debug")
        out = Level::Debug;
    else if (n == "info")
        out = Level::Info;
    else if (n == "warn" || n == "warning")
        out = Level::Warn;
    else if (n == "error")
        out = Level::Error;
    else if (n == "off" || n == "none")
        out = Level::Off;
    else
        return false;
    return true;
}

void write(Level lvl, const std::string& message) {
    std::lock_guard<std::mutex> guard(sinkMutex());
    std::cerr << "[contactstore] " << levelName(lvl) << ": " << message << '\n';
}

} // namespace log
} // namespace ContactStore
