#ifndef ENVLOG_DIRECTIVE_HPP
#define ENVLOG_DIRECTIVE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "envlog/level.hpp"

namespace envlog {

// #######################################
//  Rule / Ruleset
// #######################################

/// One `target=level` directive. `target` holds the dot-separated segments
/// of the logger name prefix; it is never empty and no segment is empty.
struct Rule {
  std::vector<std::string> target;
  Level level = kDefaultLevel;
};

/// Rules in the order they appeared in the directive string, plus the
/// default level applied when no rule matches.
struct Ruleset {
  std::vector<Rule> rules;
  Level default_level = kDefaultLevel;
};

// #######################################
//  Diagnostics
// #######################################

enum class SkipReason {
  UnknownLevel, // bare or right-hand level name not recognized
  EmptyTarget,  // "=info"
  EmptySegment, // "a..b=info", ".a=info", "a.=info"
};

struct SkippedDirective {
  std::string text;
  SkipReason reason;
};

struct ParseResult {
  Ruleset ruleset;
  std::vector<SkippedDirective> skipped;
};

[[nodiscard]] std::string_view skip_reason_label(SkipReason reason);

// #######################################
//  Parsing
// #######################################

/// Parse a directive string such as "warn,myapp=info,myapp.database=trace".
/// Never fails: malformed directives are dropped individually.
[[nodiscard]] Ruleset parse(std::string_view raw);

/// Same as parse(), also reporting every dropped directive.
[[nodiscard]] ParseResult parse_with_diagnostics(std::string_view raw);

/// Render a Ruleset in canonical directive syntax, default level first.
[[nodiscard]] std::string to_string(const Ruleset &ruleset);

} // namespace envlog

#endif // ENVLOG_DIRECTIVE_HPP
