#ifndef ENVLOG_RESOLVER_HPP
#define ENVLOG_RESOLVER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

#include "envlog/directive.hpp"
#include "envlog/level.hpp"

namespace envlog {

// #######################################
//  LevelResolver
// #######################################

/// Answers "which level is enabled for this logger name?" against one
/// Ruleset at a time.
///
/// The most specific rule wins: a rule matches when its target segments are
/// a leading run of the logger name's segments ("myapp" matches
/// "myapp.database", "my" does not). Between rules of equal length the later
/// directive wins. With no matching rule the default level applies.
///
/// Reads load one immutable snapshot and never take the writer mutex.
/// reconfigure() and reset() build a new snapshot and publish it with a
/// single atomic store; concurrent writers are serialized and the last one
/// wins.
class LevelResolver {
public:
  LevelResolver();
  explicit LevelResolver(Ruleset ruleset);
  ~LevelResolver();

  LevelResolver(const LevelResolver &) = delete;
  LevelResolver &operator=(const LevelResolver &) = delete;

  /// Effective threshold for a dotted logger name.
  [[nodiscard]] Level effective_level(std::string_view logger_name) const;

  /// True iff rank(level) >= rank(effective_level(logger_name)).
  [[nodiscard]] bool is_enabled(std::string_view logger_name,
                                Level level) const;

  /// Parse `raw` and swap it in. The dropped directives are returned so the
  /// caller can report them.
  ParseResult reconfigure(std::string_view raw);

  /// Swap in an already parsed Ruleset.
  void reset(Ruleset ruleset);

  /// Currently published Ruleset.
  [[nodiscard]] std::shared_ptr<const Ruleset> ruleset() const;

private:
  struct Snapshot;

  void publish(Ruleset ruleset);

  std::atomic<std::shared_ptr<const Snapshot>> m_snapshot;
  std::mutex m_write_mutex;
};

} // namespace envlog

#endif // ENVLOG_RESOLVER_HPP
