#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "types.hpp"

namespace ferry {

/**
 * @brief Intake I/O threads, one io_context each.
 *
 * @details
 * Accepted connections are spread round-robin over the contexts, so every
 * HttpSession lives on exactly one thread and needs no strand. Transfers
 * never run here; they go to the ActiveTransfers pool.
 */
class IoContextPool {
   public:
    explicit IoContextPool(std::size_t threads);

    // Stops and joins all threads.
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void run();
    void stop();

    asio::io_context& next();
    std::size_t size() const noexcept { return workers_.size(); }

   private:
    using work_guard_type = asio::executor_work_guard<asio::io_context::executor_type>;

    struct Worker {
        asio::io_context ioc{1};
        std::optional<work_guard_type> guard;
    };

    static void serve(Worker& worker, std::size_t index);

    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> next_{0};
};

}  // namespace ferry
