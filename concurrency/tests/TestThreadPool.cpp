/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for concurrency::ThreadPool.
 */

#include <catch2/catch_test_macros.hpp>

#include "hrv/concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

namespace hrv::concurrency {

TEST_CASE("ThreadPool runs enqueued tasks", "[concurrency][threadpool]")
{
    ThreadPool pool{4};
    REQUIRE(pool.threadCount() == 4);

    auto future = pool.enqueue([](int a, int b) { return a + b; }, 40, 2);
    REQUIRE(future.get() == 42);
}

TEST_CASE("ThreadPool with zero threads uses the hardware concurrency", "[concurrency][threadpool]")
{
    ThreadPool pool{0};
    REQUIRE(pool.threadCount() >= 1);
}

TEST_CASE("ThreadPool::mapOrdered preserves input order", "[concurrency][threadpool]")
{
    ThreadPool pool{3};

    std::vector<int> inputs(257);
    std::iota(inputs.begin(), inputs.end(), 0);

    const auto squares = pool.mapOrdered(std::span<const int>{inputs}, [](const int &v) { return v * v; });

    REQUIRE(squares.size() == inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i)
        REQUIRE(squares[i] == inputs[i] * inputs[i]);
}

TEST_CASE("ThreadPool::mapOrdered finishes every task before rethrowing", "[concurrency][threadpool]")
{
    ThreadPool pool{1};
    std::atomic<int> ran{0};

    std::vector<int> inputs(64);
    std::iota(inputs.begin(), inputs.end(), 0);

    const auto failFirst = [&ran](const int &v) {
        ran.fetch_add(1);
        if (v == 0)
            throw std::runtime_error("first input fails");
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        return v;
    };

    REQUIRE_THROWS_AS(pool.mapOrdered(std::span<const int>{inputs}, failFirst), std::runtime_error);
    REQUIRE(ran.load() == static_cast<int>(inputs.size()));
}

TEST_CASE("ThreadPool drains pending work on shutdown", "[concurrency][threadpool]")
{
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    {
        ThreadPool pool{2};
        for (int i = 0; i < 100; ++i)
            futures.push_back(pool.enqueue([&counter] { counter.fetch_add(1); }));
        pool.shutdown();

        // Work submitted after shutdown runs on the caller.
        auto late = pool.enqueue([&counter] { counter.fetch_add(1); });
        late.get();
    }

    for (auto &f : futures)
        f.get();
    REQUIRE(counter.load() == 101);
}

} // namespace hrv::concurrency
