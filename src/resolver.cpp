#include "envlog/resolver.hpp"

#include <functional>
#include <memory>
#include <ranges>
#include <string>
#include <unordered_map>
#include <utility>

namespace envlog
{

// ####################################
//  Snapshot
// ####################################

// Immutable once published. Rules are folded into a segment trie in
// directive order, so a later rule with the same target overwrites the
// earlier one and the deepest node carrying a level is the winner.
struct LevelResolver::Snapshot
{
    struct TransparentHash
    {
        using is_transparent = void;
        size_t operator()(std::string_view sv) const { return std::hash<std::string_view>{}(sv); }
    };

    struct TransparentEqual
    {
        using is_transparent = void;
        bool operator()(std::string_view lhs, std::string_view rhs) const { return lhs == rhs; }
    };

    struct Node
    {
        bool has_level = false;
        Level level = kDefaultLevel;
        std::unordered_map<std::string, std::unique_ptr<Node>, TransparentHash, TransparentEqual> children;
    };

    explicit Snapshot(Ruleset rs) : ruleset(std::move(rs))
    {
        for (const Rule& rule : ruleset.rules)
            insert(rule);
    }

    void insert(const Rule& rule)
    {
        std::reference_wrapper<Node> current = root;
        for (const std::string& segment : rule.target)
        {
            auto child = current.get().children.find(std::string_view(segment));
            if (child == current.get().children.end())
                child = current.get().children.emplace(segment, std::make_unique<Node>()).first;
            current = *child->second;
        }
        current.get().has_level = true;
        current.get().level = rule.level;
    }

    [[nodiscard]] Level find_by_longest_prefix(std::string_view name) const
    {
        std::reference_wrapper<const Node> current = root;
        Level found = ruleset.default_level;

        for (const auto segment : std::views::split(name, '.'))
        {
            std::string_view segment_view(segment.begin(), segment.end());
            auto child = current.get().children.find(segment_view);
            if (child == current.get().children.end())
                break;

            if (child->second->has_level)
                found = child->second->level;

            current = *child->second;
        }

        return found;
    }

    Ruleset ruleset;
    Node root;
};

// ####################################
//  LevelResolver
// ####################################

LevelResolver::LevelResolver() : LevelResolver(Ruleset{})
{
}

LevelResolver::LevelResolver(Ruleset ruleset)
    : m_snapshot(std::make_shared<const Snapshot>(std::move(ruleset)))
{
}

LevelResolver::~LevelResolver() = default;

[[nodiscard]] Level LevelResolver::effective_level(std::string_view logger_name) const
{
    std::shared_ptr<const Snapshot> snapshot = m_snapshot.load(std::memory_order_acquire);
    return snapshot->find_by_longest_prefix(logger_name);
}

[[nodiscard]] bool LevelResolver::is_enabled(std::string_view logger_name, Level level) const
{
    return rank(level) >= rank(effective_level(logger_name));
}

ParseResult LevelResolver::reconfigure(std::string_view raw)
{
    ParseResult result = parse_with_diagnostics(raw);
    publish(result.ruleset);
    return result;
}

void LevelResolver::reset(Ruleset ruleset)
{
    publish(std::move(ruleset));
}

[[nodiscard]] std::shared_ptr<const Ruleset> LevelResolver::ruleset() const
{
    std::shared_ptr<const Snapshot> snapshot = m_snapshot.load(std::memory_order_acquire);
    return std::shared_ptr<const Ruleset>(snapshot, &snapshot->ruleset);
}

void LevelResolver::publish(Ruleset ruleset)
{
    // Build outside the lock; the lock only orders concurrent writers.
    auto snapshot = std::make_shared<const Snapshot>(std::move(ruleset));

    std::lock_guard<std::mutex> guard(m_write_mutex);
    m_snapshot.store(std::move(snapshot), std::memory_order_release);
}

} // namespace envlog
