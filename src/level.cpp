#include "envlog/level.hpp"

namespace envlog
{

namespace
{
    [[nodiscard]] bool sv_ieq(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
        {
            char ca = a[i] >= 'A' && a[i] <= 'Z' ? static_cast<char>(a[i] + 32) : a[i];
            char cb = b[i] >= 'A' && b[i] <= 'Z' ? static_cast<char>(b[i] + 32) : b[i];
            if (ca != cb)
                return false;
        }
        return true;
    }

} // namespace

[[nodiscard]] std::string_view level_label(Level level)
{
    switch (level)
    {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off:   return "OFF";
    }
    return "WARN";
}

[[nodiscard]] std::string_view level_name(Level level)
{
    switch (level)
    {
    case Level::Trace: return "trace";
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
    }
    return "warn";
}

[[nodiscard]] std::optional<Level> parse_level(std::string_view name)
{
    if (sv_ieq(name, "trace"))
        return Level::Trace;
    if (sv_ieq(name, "debug"))
        return Level::Debug;
    if (sv_ieq(name, "info"))
        return Level::Info;
    if (sv_ieq(name, "warn") || sv_ieq(name, "warning"))
        return Level::Warn;
    if (sv_ieq(name, "error"))
        return Level::Error;
    if (sv_ieq(name, "off"))
        return Level::Off;
    return std::nullopt;
}

} // namespace envlog
