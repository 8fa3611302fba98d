#ifndef CPSWAP_LOG_HPP
#define CPSWAP_LOG_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cpswap {
namespace log {

// =============================================================================
// Diagnostics to std::cerr (or a supplied stream) with a global level filter
// =============================================================================

enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

void set_level(Level level);
Level level();
bool enabled(Level level);

std::optional<Level> parse_level(std::string_view name);
const char* to_string(Level level);

// nullptr restores std::cerr
void set_stream(std::ostream* out);

void write(Level level, std::string_view message);

inline void debug(std::string_view message) { write(Level::Debug, message); }
inline void info(std::string_view message) { write(Level::Info, message); }
inline void warn(std::string_view message) { write(Level::Warn, message); }
inline void error(std::string_view message) { write(Level::Error, message); }

} // namespace log
} // namespace cpswap

#endif // CPSWAP_LOG_HPP
