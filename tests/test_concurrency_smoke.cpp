#include <envlog/logger.hpp>

#include <atomic>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace
{

void noop_sink(const char*, size_t)
{
}

const char* const kConfigA = "warn,a=info,a.b=debug";
const char* const kConfigB = "error,a=off,a.b=trace,c=info";

std::atomic<int> g_torn{0};

// Every answer must come from exactly one of the two configurations.
void check(const envlog::LevelResolver& resolver)
{
    using envlog::Level;

    Level ab = resolver.effective_level("a.b.x");
    Level a = resolver.effective_level("a.x");
    Level other = resolver.effective_level("zzz");

    if (ab != Level::Debug && ab != Level::Trace)
        g_torn.fetch_add(1, std::memory_order_relaxed);
    if (a != Level::Info && a != Level::Off)
        g_torn.fetch_add(1, std::memory_order_relaxed);
    if (other != Level::Warn && other != Level::Error)
        g_torn.fetch_add(1, std::memory_order_relaxed);

    std::string rendered = envlog::to_string(*resolver.ruleset());
    if (rendered != kConfigA && rendered != kConfigB)
        g_torn.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

int main()
{
    using namespace envlog;

    LevelResolver local(parse(kConfigA));

    set_sink(noop_sink);
    enable_logging();
    configure(kConfigA);

    std::atomic<bool> start{false};
    std::atomic<int> ready{0};

    auto reader = [&]() {
        ready.fetch_add(1, std::memory_order_relaxed);
        while (!start.load(std::memory_order_acquire))
            std::this_thread::yield();

        for (int i = 0; i < 12000; ++i)
        {
            check(local);
            check(resolver());
            log(Level::Debug, Target("a.b"), "msg {}\n", i);
        }
    };

    auto writer = [&]() {
        ready.fetch_add(1, std::memory_order_relaxed);
        while (!start.load(std::memory_order_acquire))
            std::this_thread::yield();

        for (int i = 0; i < 12000; ++i)
        {
            const char* raw = (i % 2) == 0 ? kConfigB : kConfigA;
            local.reconfigure(raw);
            configure(raw);
        }
    };

    std::vector<std::thread> threads;
    threads.emplace_back(reader);
    threads.emplace_back(reader);
    threads.emplace_back(writer);
    threads.emplace_back(writer);

    while (ready.load(std::memory_order_acquire) != 4)
        std::this_thread::yield();
    start.store(true, std::memory_order_release);

    for (auto& t : threads)
        t.join();

    reset_sink();

    if (g_torn.load() != 0)
    {
        std::fprintf(stderr, "torn reads: %d\n", g_torn.load());
        return 1;
    }

    return 0;
}
