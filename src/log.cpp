// =============================================================================
// log.cpp - Leveled diagnostics
// =============================================================================

#include "cpswap/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace cpswap {
namespace log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::ostream* g_stream = nullptr;
std::mutex g_mutex;

} // anonymous namespace

void set_level(Level level) { g_level.store(level, std::memory_order_relaxed); }

Level level() { return g_level.load(std::memory_order_relaxed); }

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(level());
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

const char* to_string(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "unknown";
}

void set_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stream = out;
}

void write(Level lvl, std::string_view message) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << "[cpswap] [" << to_string(lvl) << "] " << message << "\n";
}

} // namespace log
} // namespace cpswap
