#include "common/io_context_pool.hpp"
#include "common/log.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace shellrelay {

IOContextPool::IOContextPool(size_t workers) {
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }

    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<Worker>();
        worker->guard.emplace(net::make_work_guard(worker->ioc));
        workers_.push_back(std::move(worker));
    }

    LOG_DEBUG("IOContextPool: {} io_contexts", workers);
}

IOContextPool::~IOContextPool() {
    stop();
    join();
}

void IOContextPool::start() {
    if (started_.exchange(true)) {
        return;
    }
    for (size_t i = 0; i < workers_.size(); ++i) {
        auto& worker = *workers_[i];
        worker.thread = std::thread([this, &worker, i] { run_worker(worker, i); });
    }
}

void IOContextPool::join() {
    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (worker->thread.joinable() && worker->thread.get_id() != self) {
            worker->thread.join();
        }
    }
}

void IOContextPool::run() {
    start();
    join();
}

void IOContextPool::stop() {
    for (auto& worker : workers_) {
        worker->guard.reset();
        worker->ioc.stop();
    }
}

net::io_context& IOContextPool::get_io_context() {
    return workers_[next_.fetch_add(1, std::memory_order_relaxed) % workers_.size()]->ioc;
}

net::io_context& IOContextPool::get_io_context(size_t index) {
    if (index >= workers_.size()) {
        throw std::out_of_range("IOContextPool: no io_context at index " + std::to_string(index));
    }
    return workers_[index]->ioc;
}

void IOContextPool::run_worker(Worker& worker, size_t index) {
    try {
        worker.ioc.run();
    } catch (const std::exception& e) {
        LOG_ERROR("IOContextPool: Worker {} terminated: {}", index, e.what());
    }
    LOG_DEBUG("IOContextPool: Worker {} exited", index);
}

} // namespace shellrelay
