#include <envlog/directive.hpp>
#include <envlog/resolver.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace {

constexpr const char *kNames[] = {"",          "myapp",  "myapp.database",
                                  "myapp.api", "somelib", "a.b.c"};

bool same_answers(const envlog::LevelResolver &a,
                  const envlog::LevelResolver &b) {
  for (const char *name : kNames) {
    if (a.effective_level(name) != b.effective_level(name)) {
      std::fprintf(stderr, "answers differ for '%s'\n", name);
      return false;
    }
  }
  return true;
}

} // namespace

int main() {
  using namespace envlog;

  const char *raw = "debug,myapp=info,myapp.database=trace,somelib=off";

  LevelResolver once;
  once.reconfigure(raw);

  LevelResolver twice;
  twice.reconfigure(raw);
  twice.reconfigure(raw);

  if (!same_answers(once, twice))
    return 1;

  // A new configuration fully replaces the previous one.
  twice.reconfigure("error");
  if (twice.effective_level("myapp.database") != Level::Error ||
      !twice.ruleset()->rules.empty())
    return 1;

  // The diagnostics come back to the caller.
  ParseResult result = twice.reconfigure("info,x=loud");
  if (result.skipped.size() != 1 || result.ruleset.default_level != Level::Info)
    return 1;

  // A held ruleset outlives the swap.
  std::shared_ptr<const Ruleset> held = twice.ruleset();
  twice.reset(parse("trace"));
  if (held->default_level != Level::Info ||
      twice.ruleset()->default_level != Level::Trace)
    return 1;

  // The canonical rendering configures an equivalent resolver.
  Ruleset parsed = parse(" DEBUG , myapp=Info,myapp.database = trace,somelib=off");
  std::string rendered = to_string(parsed);
  if (rendered != "debug,myapp=info,myapp.database=trace,somelib=off") {
    std::fprintf(stderr, "rendered '%s'\n", rendered.c_str());
    return 1;
  }

  LevelResolver from_rendered(parse(rendered));
  if (!same_answers(once, from_rendered))
    return 1;

  return 0;
}
