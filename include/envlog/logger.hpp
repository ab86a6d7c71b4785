#ifndef ENVLOG_LOGGER_HPP
#define ENVLOG_LOGGER_HPP

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "envlog/directive.hpp"
#include "envlog/level.hpp"
#include "envlog/resolver.hpp"

namespace envlog {

// #######################################
//  Target — strong type for logger names
// #######################################

/// Wraps a dotted logger name to disambiguate the log() overload.
///
/// Example:
///   envlog::log(Level::Debug, Target("myapp.database"), "pool size={}\n", 8);
///
struct Target {
  std::string_view name;

  explicit Target(std::string_view n) : name(n) {}
  explicit Target(const char *n)
      : name(n ? std::string_view(n) : std::string_view{}) {}
};

// #######################################
//  Configuration
// #######################################

/// Environment variable read by init_once().
inline constexpr const char *kDefaultEnvVar = "PTHN_LOG";

/// Process-wide resolver handle, for injection into a host logging facility.
/// Runs init_once() first so the env default is in place.
[[nodiscard]] LevelResolver &resolver();

/// Replace the process configuration with a directive string.
/// Dropped directives are reported under the "envlog" target.
/// Explicit calls always take precedence over the env var default.
void configure(std::string_view raw);

/// Configure from the named environment variable right now. An unset
/// variable configures the empty string (default level, no rules).
/// Counts as an explicit call.
void configure_from_env(const char *env_var);

/// Effective level of `logger_name` under the process configuration.
[[nodiscard]] Level effective_level(std::string_view logger_name);

/// Whether a message at `level` for `logger_name` passes the process
/// configuration.
[[nodiscard]] bool is_enabled(std::string_view logger_name, Level level);

// #######################################
//  Output
// #######################################

/// Enable log output (disabled by default).
void enable_logging();

/// Disable log output.
void disable_logging();

/// Check whether log output is currently enabled.
[[nodiscard]] bool log_is_enabled();

/// Set the log prefix tag (default: "==envlog==").
/// Thread-safe. The string is copied internally.
void set_prefix(std::string_view prefix);

/// Callback type for custom sinks.
using SinkFn = void (*)(const char *data, size_t size);

/// Redirect all log output to a custom sink function.
/// Pass nullptr to revert to stderr (same as reset_sink()).
void set_sink(SinkFn fn);

/// Revert to the default stderr sink.
void reset_sink();

// #######################################
//  Internal — used by log() templates
// #######################################

/// Format `|pid| prefix [LEVEL] (target) message` and hand it to the sink
/// in one write. The target is omitted when empty.
void write_log_line(Level level, std::string_view target,
                    std::string_view message);

/// Lazy one-time initialization from kDefaultEnvVar.
void init_once();

// #######################################
//  Main logging function
// #######################################

/// Log a formatted message under a logger name. Written only when output is
/// enabled and the level passes the resolver for that name. Level::Off is
/// never written.
///
/// Example:
///   envlog::log(Level::Info, Target("myapp.api"), "listening on {}\n", 8080);
///
template <typename... Args>
inline void log(Level level, Target target, std::string_view fmt,
                Args &&...args) {
  init_once();

  if (!log_is_enabled() || level == Level::Off)
    return;
  if (!is_enabled(target.name, level))
    return;

  try {
    std::string msg = std::vformat(fmt, std::make_format_args(args...));
    if (msg.empty())
      return;

    write_log_line(level, target.name, msg);
  } catch (const std::format_error &) {
    write_log_line(level, target.name, "envlog: log format error\n");
  }
}

/// Log a formatted message under the root logger (default level only).
template <typename... Args>
inline void log(Level level, std::string_view fmt, Args &&...args) {
  log(level, Target(std::string_view{}), fmt, std::forward<Args>(args)...);
}

} // namespace envlog

#endif // ENVLOG_LOGGER_HPP
