#include "envlog/directive.hpp"

#include <utility>

namespace envlog
{

namespace
{
    [[nodiscard]] bool is_space(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    [[nodiscard]] std::string_view trim(std::string_view value)
    {
        while (!value.empty() && is_space(value.front()))
            value.remove_prefix(1);
        while (!value.empty() && is_space(value.back()))
            value.remove_suffix(1);
        return value;
    }

    // Splits "a.b.c" into its trimmed segments. Returns false if any segment
    // is empty after trimming.
    [[nodiscard]] bool split_target(std::string_view target, std::vector<std::string>& out)
    {
        size_t start = 0;
        while (true)
        {
            size_t end = target.find('.', start);
            std::string_view segment = trim(
                target.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
            if (segment.empty())
                return false;

            out.emplace_back(segment);

            if (end == std::string_view::npos)
                return true;
            start = end + 1;
        }
    }

    void parse_directive(std::string_view token, ParseResult& result)
    {
        size_t eq = token.find('=');

        // Bare level: sets the default, last one wins.
        if (eq == std::string_view::npos)
        {
            if (auto level = parse_level(token))
                result.ruleset.default_level = *level;
            else
                result.skipped.push_back({std::string(token), SkipReason::UnknownLevel});
            return;
        }

        std::string_view target = trim(token.substr(0, eq));
        std::string_view level_text = trim(token.substr(eq + 1));

        if (target.empty())
        {
            result.skipped.push_back({std::string(token), SkipReason::EmptyTarget});
            return;
        }

        Rule rule;
        if (!split_target(target, rule.target))
        {
            result.skipped.push_back({std::string(token), SkipReason::EmptySegment});
            return;
        }

        auto level = parse_level(level_text);
        if (!level)
        {
            result.skipped.push_back({std::string(token), SkipReason::UnknownLevel});
            return;
        }

        rule.level = *level;
        result.ruleset.rules.push_back(std::move(rule));
    }

} // namespace

[[nodiscard]] std::string_view skip_reason_label(SkipReason reason)
{
    switch (reason)
    {
    case SkipReason::UnknownLevel: return "unknown level";
    case SkipReason::EmptyTarget:  return "empty target";
    case SkipReason::EmptySegment: return "empty target segment";
    }
    return "unknown";
}

[[nodiscard]] ParseResult parse_with_diagnostics(std::string_view raw)
{
    ParseResult result;

    size_t start = 0;
    while (start <= raw.size())
    {
        size_t end = raw.find(',', start);
        if (end == std::string_view::npos)
            end = raw.size();

        std::string_view token = trim(raw.substr(start, end - start));
        if (!token.empty())
            parse_directive(token, result);

        start = end + 1;
    }

    return result;
}

[[nodiscard]] Ruleset parse(std::string_view raw)
{
    return parse_with_diagnostics(raw).ruleset;
}

[[nodiscard]] std::string to_string(const Ruleset& ruleset)
{
    std::string out(level_name(ruleset.default_level));

    for (const Rule& rule : ruleset.rules)
    {
        out.push_back(',');
        for (size_t i = 0; i < rule.target.size(); ++i)
        {
            if (i != 0)
                out.push_back('.');
            out.append(rule.target[i]);
        }
        out.push_back('=');
        out.append(level_name(rule.level));
    }

    return out;
}

} // namespace envlog
