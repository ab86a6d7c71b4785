#include "envlog/logger.hpp"

#include <cstdlib>
#include <errno.h>
#include <iterator>
#include <pthread.h>
#include <unistd.h>

namespace envlog
{

// ####################################
//  Global state
// ####################################

namespace
{
    int g_log_enabled = 0;
    int g_configured_explicitly = 0;

    SinkFn g_sink = nullptr;

    pthread_once_t g_init_once = PTHREAD_ONCE_INIT;

    std::string g_prefix = "==envlog==";
    pthread_mutex_t g_prefix_mutex = PTHREAD_MUTEX_INITIALIZER;

    // Orders whole lines at the sink.
    pthread_mutex_t g_output_mutex = PTHREAD_MUTEX_INITIALIZER;

    struct MutexGuard
    {
        explicit MutexGuard(pthread_mutex_t& m) : mutex(m) { pthread_mutex_lock(&mutex); }
        ~MutexGuard() { pthread_mutex_unlock(&mutex); }

        MutexGuard(const MutexGuard&) = delete;
        MutexGuard& operator=(const MutexGuard&) = delete;

        pthread_mutex_t& mutex;
    };

    // ── Line formatting ──────────────────────

    [[nodiscard]] bool colors_enabled()
    {
        static const bool enabled = getenv("NO_COLOR") == nullptr && isatty(2) != 0;
        return enabled;
    }

    [[nodiscard]] std::string_view level_escape(Level level)
    {
        switch (level)
        {
        case Level::Trace: return "\x1b[35m";
        case Level::Debug: return "\x1b[34m";
        case Level::Info:  return "\x1b[32m";
        case Level::Warn:  return "\x1b[33m";
        case Level::Error: return "\x1b[31m";
        case Level::Off:   break;
        }
        return "\x1b[36m";
    }

    [[nodiscard]] int process_id()
    {
        static const int cached = static_cast<int>(getpid());
        return cached;
    }

    [[nodiscard]] std::string current_prefix()
    {
        MutexGuard guard(g_prefix_mutex);
        return g_prefix;
    }

    // |pid| prefix [LEVEL] (target) message
    [[nodiscard]] std::string format_line(Level level, std::string_view target, std::string_view message)
    {
        const bool colored = colors_enabled();
        const std::string_view reset = colored ? "\x1b[0m" : "";
        const std::string_view dim = colored ? "\x1b[2m" : "";
        const std::string_view tag = colored ? "\x1b[90;3m" : "";
        const std::string_view level_on = colored ? level_escape(level) : "";

        std::string line = std::format("{}|{}|{} {}{} {}{}[{}]{}", dim, process_id(), reset, tag,
                                       current_prefix(), reset, level_on, level_label(level), reset);

        if (!target.empty())
            std::format_to(std::back_inserter(line), " {}({}){}", dim, target, reset);

        line.push_back(' ');
        line.append(message);
        return line;
    }

    // Default sink: stderr, retried on EINTR and short writes.
    void write_stderr(std::string_view data)
    {
        while (!data.empty())
        {
            ssize_t written = write(2, data.data(), data.size());
            if (written > 0)
            {
                data.remove_prefix(static_cast<size_t>(written));
                continue;
            }
            if (written < 0 && errno == EINTR)
                continue;
            break;
        }
    }

    void emit(std::string_view line)
    {
        MutexGuard guard(g_output_mutex);

        SinkFn sink = __atomic_load_n(&g_sink, __ATOMIC_ACQUIRE);
        if (sink)
            sink(line.data(), line.size());
        else
            write_stderr(line);
    }

    // ── Resolver ─────────────────────────────

    [[nodiscard]] LevelResolver& global_resolver()
    {
        static LevelResolver instance;
        return instance;
    }

    constexpr std::string_view kSelfTarget = "envlog";

    // Must not go through log(): it runs init_once(), and report() is also
    // reached from inside the once routine.
    [[nodiscard]] bool self_enabled(Level level)
    {
        return log_is_enabled() && global_resolver().is_enabled(kSelfTarget, level);
    }

    // Reports dropped directives and the resulting configuration under the
    // library's own target, so "envlog=off" silences it.
    void report(const ParseResult& result)
    {
        if (self_enabled(Level::Warn))
        {
            for (const SkippedDirective& skipped : result.skipped)
            {
                write_log_line(Level::Warn, kSelfTarget,
                               std::format("skipped directive '{}': {}\n", skipped.text,
                                           skip_reason_label(skipped.reason)));
            }
        }

        if (self_enabled(Level::Debug))
        {
            write_log_line(Level::Debug, kSelfTarget,
                           std::format("configured '{}'\n", to_string(result.ruleset)));
        }
    }

    void init_from_env()
    {
        // PTHN_LOG=<directives> (default only, explicit API has priority)
        if (__atomic_load_n(&g_configured_explicitly, __ATOMIC_ACQUIRE) != 0)
            return;

        const char* env_value = getenv(kDefaultEnvVar);
        if (!env_value)
            return;

        report(global_resolver().reconfigure(env_value));
    }

    void configure_explicitly(std::string_view raw)
    {
        __atomic_store_n(&g_configured_explicitly, 1, __ATOMIC_RELEASE);
        init_once();

        report(global_resolver().reconfigure(raw));
    }

} // namespace

// ####################################
//  Init
// ####################################

void init_once()
{
    (void)pthread_once(&g_init_once, init_from_env);
}

// ####################################
//  Configuration
// ####################################

[[nodiscard]] LevelResolver& resolver()
{
    init_once();
    return global_resolver();
}

void configure(std::string_view raw)
{
    configure_explicitly(raw);
}

void configure_from_env(const char* env_var)
{
    const char* env_value = env_var ? getenv(env_var) : nullptr;
    configure_explicitly(env_value ? std::string_view(env_value) : std::string_view{});
}

[[nodiscard]] Level effective_level(std::string_view logger_name)
{
    return resolver().effective_level(logger_name);
}

[[nodiscard]] bool is_enabled(std::string_view logger_name, Level level)
{
    return resolver().is_enabled(logger_name, level);
}

// ####################################
//  Output
// ####################################

void enable_logging()
{
    __atomic_store_n(&g_log_enabled, 1, __ATOMIC_RELEASE);
}

void disable_logging()
{
    __atomic_store_n(&g_log_enabled, 0, __ATOMIC_RELEASE);
}

[[nodiscard]] bool log_is_enabled()
{
    return __atomic_load_n(&g_log_enabled, __ATOMIC_ACQUIRE) != 0;
}

void set_prefix(std::string_view prefix)
{
    MutexGuard guard(g_prefix_mutex);
    g_prefix.assign(prefix);
}

void set_sink(SinkFn fn)
{
    __atomic_store_n(&g_sink, fn, __ATOMIC_RELEASE);
}

void reset_sink()
{
    __atomic_store_n(&g_sink, static_cast<SinkFn>(nullptr), __ATOMIC_RELEASE);
}

void write_log_line(Level level, std::string_view target, std::string_view message)
{
    emit(format_line(level, target, message));
}

} // namespace envlog
