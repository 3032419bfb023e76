#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Owns an Asio io_context and the worker threads that run it.
 *
 * Network services post their probes and asynchronous socket operations
 * here. A work guard keeps the workers alive between bursts of work. The
 * instance is created by the process entry point (or a test) and passed to
 * the services that need it.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param threadCount Number of worker threads (defaults to hardware concurrency, minimum 1).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the io_context and joins the workers.
     */
    void stop();

    /**
     * @brief Returns the underlying io_context.
     */
    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Checks whether the worker threads are running.
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the configured number of worker threads.
     */
    size_t threadCount() const { return threadCount_; }

    /**
     * @brief Queues a handler for execution on a worker thread.
     * @tparam Handler Callable type.
     * @param handler The handler to run.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace netsentry::infra
