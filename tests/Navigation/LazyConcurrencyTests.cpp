/// @file LazyConcurrencyTests.cpp
/// @brief First visits to lazily built children from several threads.

#include <JNAV/Navigation/Document.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace JNAV::Navigation;

namespace
{
    std::string MakeWideDocument(int width)
    {
        std::string text = "{";
        for (int i = 0; i < width; ++i)
        {
            if (i != 0)
                text += ',';
            text += "\"k" + std::to_string(i) + "\": [" + std::to_string(i) + ", {\"v\": " + std::to_string(i) + "}]";
        }
        text += '}';
        return text;
    }
}// namespace

TEST_CASE("Lazy nodes hand out one child instance across threads", "[Navigation][Lazy][Concurrency]")
{
    constexpr int width       = 64;
    constexpr int threadCount = 8;

    NavigationOptions options;
    options.construction = Construction::Lazy;

    auto parsed = Document::Parse(MakeWideDocument(width), options);
    REQUIRE(parsed.HasValue());
    const Node root = parsed.ValueUnsafe();

    std::vector<std::vector<Node>> seen(threadCount);
    std::atomic<bool>              start {false};
    std::atomic<int>               failures {0};
    std::vector<std::thread>       workers;
    workers.reserve(threadCount);

    for (int t = 0; t < threadCount; ++t)
    {
        workers.emplace_back([&, t] {
            while (!start.load(std::memory_order_acquire))
                std::this_thread::yield();

            for (int i = 0; i < width; ++i)
            {
                const Node value = root.ByKey("k" + std::to_string(i)).ByIndex(1).ByKey("v");
                if (value.AsInt().ValueOr(-1) != i)
                    failures.fetch_add(1, std::memory_order_relaxed);
                seen[t].push_back(value);
            }
        });
    }

    start.store(true, std::memory_order_release);
    for (auto& worker: workers)
    {
        worker.join();
    }

    CHECK(failures.load() == 0);
    for (int t = 1; t < threadCount; ++t)
    {
        for (int i = 0; i < width; ++i)
        {
            CHECK(seen[t][i].IsSameAs(seen[0][i]));
        }
    }
}
