#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "TransferOrchestrator.hpp"
#include "types.hpp"

namespace ferry {

/**
 * @brief Registry of running transfers and the thread pool they run on.
 *
 * @details
 * Submit validates on the caller's thread and hands the rest of the state
 * machine to a bounded pool, one pool thread per record.
 * **Thread Safety:** All methods may be called from any HTTP worker.
 */
class ActiveTransfers {
   public:
    ActiveTransfers(std::shared_ptr<TransferOrchestrator> orchestrator, unsigned int threads);
    ~ActiveTransfers();

    ActiveTransfers(const ActiveTransfers&) = delete;
    ActiveTransfers& operator=(const ActiveTransfers&) = delete;

    /**
     * @brief Accepts the request and schedules it.
     * @return The record after Validating. A Failed record was not scheduled.
     */
    TransferRecord Submit(const TransferRequest& request);

    // Stored record, running or finished.
    std::optional<TransferRecord> Get(const std::string& id) const;

    std::vector<TransferRecord> History(const std::string& requested_by, std::size_t limit) const;

    std::vector<std::string> list_ids() const;
    std::size_t size() const noexcept;

    // Waits for every scheduled transfer to reach its terminal state.
    void stop_all();

   private:
    void on_finished(const std::string& id);

    std::shared_ptr<TransferOrchestrator> orchestrator_;
    asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> running_;
    std::atomic<bool> stopped_{false};
};

}  // namespace ferry
