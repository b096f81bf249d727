// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.hpp
/// @brief Fixed-size thread pool with std::future-based task submission.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hrv/core/Types.hpp>
#include <hrv/core/NonCopyable.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <span>
#include <thread>
#include <type_traits>
#include <vector>

namespace hrv::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadPool
/// @brief Simple fixed-thread-count pool.
///
/// Workers pull tasks from a shared FIFO queue protected by a mutex +
/// condition variable.  Use @ref enqueue for a single task and
/// @ref mapOrdered to fan a pure function out over a range of inputs
/// while keeping the results in input order.
///
/// Call @ref shutdown to drain all queued tasks; the destructor calls
/// @c shutdown implicitly.
// /////////////////////////////////////////////////////////////////////////////
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /// @brief Creates the pool with @p threadCount worker threads.
    /// @param threadCount Number of worker threads.  Zero means
    ///        @c std::thread::hardware_concurrency().
    explicit ThreadPool(core::u32 threadCount = 0);

    /// @brief Drains pending tasks and joins all workers.
    ~ThreadPool();

    // --------------------------------------------------------------------- //
    //  Task submission                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Enqueues a callable and returns its future.
    ///
    /// After @ref shutdown the callable runs inline on the caller's thread
    /// so the returned future is always satisfied.
    /// @tparam F Callable type.
    /// @tparam Args Argument types.
    /// @param func Callable to execute.
    /// @param args Arguments forwarded to @p func.
    /// @return @c std::future holding the return value.
    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F&& func, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Applies @p func to every element of @p inputs on the pool.
    ///
    /// Tasks are submitted in input order and their futures drained in the
    /// same order, so the output is identical to a sequential loop. Every
    /// task has finished before the first exception, if any, is rethrown.
    /// @tparam T Input element type.
    /// @tparam F Callable taking <tt>const T&</tt>.
    /// @return One result per input, in input order.
    template <typename T, typename F>
    [[nodiscard]] auto mapOrdered(std::span<const T> inputs, F&& func)
        -> std::vector<std::invoke_result_t<F&, const T&>>;

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Signals workers to finish and blocks until all pending tasks
    ///        are processed.
    void shutdown();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] core::u32 threadCount() const noexcept;

private:
    /// @brief Worker loop: waits on the CV and processes tasks.
    void workerLoop();

    std::vector<std::thread>            workers_;
    std::deque<std::function<void()>>   tasks_;
    std::mutex                          mutex_;
    std::condition_variable             cv_;
    std::atomic<bool>                   stopping_{false};
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& func, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...)
    );

    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (!stopping_.load(std::memory_order_relaxed))
        {
            tasks_.emplace_back([task]() { (*task)(); });
            cv_.notify_one();
            return future;
        }
    }

    (*task)();
    return future;
}

template <typename T, typename F>
auto ThreadPool::mapOrdered(std::span<const T> inputs, F&& func)
    -> std::vector<std::invoke_result_t<F&, const T&>>
{
    using ReturnType = std::invoke_result_t<F&, const T&>;

    std::vector<std::future<ReturnType>> futures;
    futures.reserve(inputs.size());
    for (const T& input : inputs)
    {
        futures.push_back(enqueue([&func, &input]() { return func(input); }));
    }

    // Tasks reference func and inputs; none may outlive this call.
    for (auto& future : futures)
    {
        future.wait();
    }

    std::vector<ReturnType> results;
    results.reserve(futures.size());
    for (auto& future : futures)
    {
        results.push_back(future.get());
    }
    return results;
}

} // namespace hrv::concurrency
