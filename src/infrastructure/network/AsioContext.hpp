#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace vidscan::infra {

/**
 * @brief Owns the Asio I/O context and the threads that drive it.
 *
 * All socket, TLS and timer work of the prober and the HTTP client runs on
 * these threads. Discovery workers block on futures fulfilled here, so they
 * must never be I/O threads themselves.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of I/O threads (at least one).
     */
    explicit AsioContext(size_t threadCount = 2);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the I/O threads. Has no effect if already running.
     * @throws std::system_error if a thread cannot be created.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the threads.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    asio::io_context& getContext() { return ioContext_; }

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

} // namespace vidscan::infra
