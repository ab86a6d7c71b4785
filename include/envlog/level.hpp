#ifndef ENVLOG_LEVEL_HPP
#define ENVLOG_LEVEL_HPP

#include <optional>
#include <string_view>

namespace envlog {

// #######################################
//  Level
// #######################################

/// Ordered by verbosity, Trace being the most verbose.
/// Off is only meaningful as a threshold; nothing is ever emitted at Off.
enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/// Fallback default when a directive string sets no bare level.
inline constexpr Level kDefaultLevel = Level::Warn;

/// Monotone rank used for every threshold comparison.
[[nodiscard]] constexpr int rank(Level level) { return static_cast<int>(level); }

/// Return the label string for a log level ("TRACE", ..., "OFF").
[[nodiscard]] std::string_view level_label(Level level);

/// Return the lowercase directive spelling ("trace", ..., "off").
[[nodiscard]] std::string_view level_name(Level level);

/// Parse a level name, case-insensitive. Accepts trace, debug, info, warn,
/// warning, error and off. Returns std::nullopt for anything else.
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

} // namespace envlog

#endif // ENVLOG_LEVEL_HPP
