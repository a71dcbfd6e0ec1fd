#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace shellrelay {

namespace net = boost::asio;

/**
 * IOContextPool - one single-threaded io_context per worker
 *
 * Accepted connections are handed out round-robin. A console session lives
 * on the io_context it was accepted onto, so both of its sockets and its
 * timers are only touched from that worker's thread.
 */
class IOContextPool {
public:
    // 0 workers = hardware_concurrency (at least 1)
    explicit IOContextPool(size_t workers = 0);
    ~IOContextPool();

    IOContextPool(const IOContextPool&) = delete;
    IOContextPool& operator=(const IOContextPool&) = delete;

    // Launch the worker threads. Idempotent.
    void start();

    // Wait for the worker threads. Skips the calling thread if it is a worker.
    void join();

    // start() then join()
    void run();

    // Drop the work guards and stop every io_context. Callable from any thread.
    void stop();

    // Round-robin pick
    net::io_context& get_io_context();
    net::io_context& get_io_context(size_t index);

    size_t size() const { return workers_.size(); }

private:
    struct Worker {
        net::io_context ioc{1};
        std::optional<net::executor_work_guard<net::io_context::executor_type>> guard;
        std::thread thread;
    };

    void run_worker(Worker& worker, size_t index);

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<size_t> next_{0};
    std::atomic<bool> started_{false};
};

} // namespace shellrelay
