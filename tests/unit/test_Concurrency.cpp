#include <catch2/catch_test_macros.hpp>

#include "core/util/Concurrency.hpp"

#include <atomic>
#include <numeric>
#include <stdexcept>

using namespace netsentry::core;
using namespace std::chrono_literals;

TEST_CASE("forEachBounded respects the concurrency limit", "[Concurrency]") {
    std::vector<int> items(40);
    std::iota(items.begin(), items.end(), 0);

    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    std::atomic<int> processed{0};

    forEachBounded(items, 4, [&](int) {
        int now = ++inFlight;
        int previous = maxInFlight.load();
        while (now > previous && !maxInFlight.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(5ms);
        --inFlight;
        ++processed;
    });

    REQUIRE(processed.load() == 40);
    REQUIRE(maxInFlight.load() <= 4);
    REQUIRE(maxInFlight.load() >= 1);
}

TEST_CASE("forEachBounded processes every item despite failures", "[Concurrency]") {
    std::vector<int> items{1, 2, 3, 4, 5, 6};
    std::atomic<int> processed{0};

    REQUIRE_THROWS_AS(forEachBounded(items, 3,
                                     [&](int item) {
                                         ++processed;
                                         if (item % 2 == 0) {
                                             throw std::runtime_error("probe failed");
                                         }
                                     }),
                      std::runtime_error);
    REQUIRE(processed.load() == 6);
}

TEST_CASE("forEachBounded on an empty list does nothing", "[Concurrency]") {
    bool called = false;
    forEachBounded(std::vector<int>{}, 4, [&](int) { called = true; });
    REQUIRE_FALSE(called);
}

TEST_CASE("ConcurrencyLimiter permits", "[Concurrency]") {
    ConcurrencyLimiter limiter(0);
    REQUIRE(limiter.limit() == 1);

    {
        auto permit = limiter.acquire();
    }
    // The permit was returned, so a second acquire does not block.
    auto again = limiter.acquire();
    SUCCEED();
}

TEST_CASE("withRetry backs off exponentially", "[Concurrency][Retry]") {
    SECTION("Succeeds after transient failures") {
        int calls = 0;
        auto start = std::chrono::steady_clock::now();
        int value = withRetry(
            [&]() {
                if (++calls < 3) {
                    throw std::runtime_error("timeout");
                }
                return 7;
            },
            RetryPolicy{3, 20ms});
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(value == 7);
        REQUIRE(calls == 3);
        // 20ms after the first failure, 40ms after the second.
        REQUIRE(elapsed >= 60ms);
    }

    SECTION("Last exception propagates unchanged") {
        int calls = 0;
        REQUIRE_THROWS_WITH(withRetry(
                                [&]() -> int {
                                    ++calls;
                                    throw std::runtime_error("attempt " + std::to_string(calls));
                                },
                                RetryPolicy{2, 1ms}),
                            "attempt 2");
        REQUIRE(calls == 2);
    }

    SECTION("Attempts below one mean a single call") {
        int calls = 0;
        REQUIRE_THROWS(withRetry(
            [&]() -> int {
                ++calls;
                throw std::runtime_error("down");
            },
            RetryPolicy{0, 1ms}));
        REQUIRE(calls == 1);
    }
}
