/**
 * @file Concurrency.hpp
 * @brief Bounded parallelism and retry-with-backoff combinators.
 *
 * These are applied uniformly to monitor calls and scan probes so that the
 * concurrency bound and the backoff contract can be tested in isolation.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <semaphore>
#include <thread>
#include <vector>

namespace netsentry::core {

/**
 * @brief Counting limiter with RAII permits.
 *
 * Callers beyond the limit block in acquire() until a permit is returned.
 */
class ConcurrencyLimiter {
public:
    /**
     * @brief A held permit, returned to the limiter on destruction.
     */
    class Permit {
    public:
        explicit Permit(ConcurrencyLimiter* owner) : owner_(owner) {}
        ~Permit() {
            if (owner_) {
                owner_->release();
            }
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyLimiter* owner_;
    };

    /**
     * @brief Constructs a limiter.
     * @param maxConcurrent Number of permits (values below 1 are treated as 1).
     */
    explicit ConcurrencyLimiter(int maxConcurrent)
        : limit_(std::max(1, maxConcurrent)), semaphore_(limit_) {}

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @brief Blocks until a permit is available.
     * @return The permit.
     */
    [[nodiscard]] Permit acquire() {
        semaphore_.acquire();
        return Permit(this);
    }

    /**
     * @brief Blocks until a permit is available, without RAII.
     *
     * Pair with release(); used where the permit outlives the acquiring scope
     * (asynchronous completion handlers).
     */
    void acquireRaw() { semaphore_.acquire(); }

    /**
     * @brief Returns a permit taken with acquireRaw().
     */
    void release() { semaphore_.release(); }

    [[nodiscard]] int limit() const { return limit_; }

private:
    int limit_;
    std::counting_semaphore<> semaphore_;
};

/**
 * @brief Runs fn on every item with at most maxConcurrent calls in flight.
 *
 * A fixed pool of min(maxConcurrent, items.size()) worker threads pulls items
 * in order; extra items queue. Every item is processed even if some calls
 * throw; the first exception is rethrown once all workers finished.
 *
 * @param items Items to process.
 * @param maxConcurrent Pool size (values below 1 are treated as 1).
 * @param fn Callable invoked as fn(const Item&).
 */
template <typename Item, typename Fn>
void forEachBounded(const std::vector<Item>& items, int maxConcurrent, Fn&& fn) {
    if (items.empty()) {
        return;
    }

    size_t workerCount = std::min(items.size(), static_cast<size_t>(std::max(1, maxConcurrent)));
    std::atomic<size_t> next{0};
    std::exception_ptr firstError;
    std::mutex errorMutex;

    auto worker = [&]() {
        for (size_t i = next++; i < items.size(); i = next++) {
            try {
                fn(items[i]);
            } catch (...) {
                std::lock_guard lock(errorMutex);
                if (!firstError) {
                    firstError = std::current_exception();
                }
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

/**
 * @brief Retry schedule for withRetry().
 */
struct RetryPolicy {
    int attempts{3};                                ///< Total attempts (values below 1 mean 1)
    std::chrono::milliseconds baseDelay{1000};      ///< Delay after the first failure
};

/**
 * @brief Calls fn until it returns without throwing, backing off exponentially.
 *
 * The delay after failed attempt k (1-based) is baseDelay * 2^(k-1). When
 * the last attempt fails, its exception propagates unchanged.
 *
 * @param fn Callable taking no arguments.
 * @param policy Attempt count and base delay.
 * @return Whatever fn returns.
 */
template <typename Fn>
auto withRetry(Fn&& fn, const RetryPolicy& policy) -> decltype(fn()) {
    const int attempts = std::max(1, policy.attempts);
    auto delay = policy.baseDelay;

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& e) {
            if (attempt >= attempts) {
                throw;
            }
            spdlog::debug("Attempt {}/{} failed: {}; retrying in {} ms", attempt, attempts,
                          e.what(), delay.count());
        }
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

} // namespace netsentry::core
