#include <envlog/logger.hpp>

#include <cstdio>

// Try:
//   PTHN_LOG=info ./envlog_example
//   PTHN_LOG=debug,myapp.database=trace ./envlog_example
//   PTHN_LOG=warn,myapp=info ./envlog_example
int main() {
  using namespace envlog;

  // Configuration comes from $PTHN_LOG on first use.
  init_once();
  enable_logging();

  // ── 1. Loggers at different depths ──────────
  log(Level::Debug, Target("myapp"), "Application starting\n");
  log(Level::Info, Target("myapp"), "Application initialized\n");

  log(Level::Debug, Target("myapp.database"), "Connection pool created\n");
  log(Level::Info, Target("myapp.database"), "Database connected\n");

  log(Level::Debug, Target("myapp.api"), "API server starting\n");
  log(Level::Info, Target("myapp.api"), "API server listening on port {}\n",
      8080);

  log(Level::Debug, Target("somelib"), "Library function called\n");
  log(Level::Info, Target("somelib"), "Library initialized\n");
  log(Level::Warn, Target("somelib"), "Library warning\n");

  // ── 2. Querying without logging ─────────────
  const char *names[] = {"myapp", "myapp.database", "myapp.api", "somelib"};
  for (const char *name : names) {
    std::fprintf(stderr, "  %-16s -> %.*s\n", name,
                 static_cast<int>(level_label(effective_level(name)).size()),
                 level_label(effective_level(name)).data());
  }

  // ── 3. Reconfiguring at runtime ─────────────
  configure("warn,myapp.database=trace,bogus=loud");
  log(Level::Trace, Target("myapp.database"), "Now visible at trace\n");
  log(Level::Info, Target("myapp.api"), "This INFO should NOT appear\n");

  std::fprintf(stderr, "\nCurrent configuration: %s\n",
               to_string(*resolver().ruleset()).c_str());

  return 0;
}
