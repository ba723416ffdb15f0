#include "IoContextPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ferry {

IoContextPool::IoContextPool(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("server.threads must be > 0");
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        auto worker = std::make_unique<Worker>();
        worker->guard.emplace(asio::make_work_guard(worker->ioc));
        workers_.push_back(std::move(worker));
    }
}

IoContextPool::~IoContextPool() {
    stop();
    threads_.clear();
}

void IoContextPool::run() {
    if (!threads_.empty()) {
        return;
    }
    spdlog::info("Starting {} intake I/O thread(s)", workers_.size());
    threads_.reserve(workers_.size());
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        threads_.emplace_back([worker = workers_[i].get(), i] { serve(*worker, i); });
    }
}

void IoContextPool::serve(Worker& worker, std::size_t index) {
    // A handler that throws loses its own connection, not the thread.
    for (;;) {
        try {
            worker.ioc.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("[Io {}] Handler threw: {}", index, e.what());
        }
    }
}

void IoContextPool::stop() {
    for (auto& worker : workers_) {
        worker->guard.reset();
        worker->ioc.stop();
    }
}

asio::io_context& IoContextPool::next() {
    const auto idx = next_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
    return workers_[idx]->ioc;
}

}  // namespace ferry
