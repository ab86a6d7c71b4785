#include <envlog/directive.hpp>
#include <envlog/resolver.hpp>

#include <cstdio>

namespace {

constexpr envlog::Level kLevels[] = {
    envlog::Level::Trace, envlog::Level::Debug, envlog::Level::Info,
    envlog::Level::Warn,  envlog::Level::Error, envlog::Level::Off,
};

constexpr const char *kNames[] = {"", "myapp", "myapp.database", "quiet",
                                  "quiet.inner", "other"};

} // namespace

int main() {
  using namespace envlog;

  const char *configs[] = {
      "",
      "trace",
      "off",
      "info,myapp=debug,myapp.database=error,quiet=off,quiet.inner=trace",
      "error,myapp=off",
  };

  for (const char *config : configs) {
    LevelResolver resolver(parse(config));

    for (const char *name : kNames) {
      Level threshold = resolver.effective_level(name);

      bool previous = false;
      for (Level level : kLevels) {
        bool enabled = resolver.is_enabled(name, level);

        if (enabled != (rank(level) >= rank(threshold))) {
          std::fprintf(stderr, "[%s] %s: is_enabled(%d) disagrees with rank\n",
                       config, name, rank(level));
          return 1;
        }

        // Once a level passes, every coarser level passes too.
        if (previous && !enabled) {
          std::fprintf(stderr, "[%s] %s: not monotone at %d\n", config, name,
                       rank(level));
          return 1;
        }
        previous = enabled;
      }

      if (threshold == Level::Off && resolver.is_enabled(name, Level::Error)) {
        std::fprintf(stderr, "[%s] %s: error passes an off threshold\n", config,
                     name);
        return 1;
      }
    }
  }

  LevelResolver scenario(parse("info,quiet=off,quiet.inner=trace"));
  if (scenario.is_enabled("quiet", Level::Error) ||
      !scenario.is_enabled("quiet.inner", Level::Trace) ||
      scenario.is_enabled("other", Level::Debug) ||
      !scenario.is_enabled("other", Level::Info))
    return 1;

  return 0;
}
