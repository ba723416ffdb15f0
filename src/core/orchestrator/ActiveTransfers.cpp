#include "ActiveTransfers.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <stdexcept>

namespace ferry {

ActiveTransfers::ActiveTransfers(std::shared_ptr<TransferOrchestrator> orchestrator,
                                 unsigned int threads)
    : orchestrator_(std::move(orchestrator)), pool_(threads == 0 ? 1 : threads) {
    if (!orchestrator_) {
        throw std::invalid_argument("ActiveTransfers: orchestrator is null");
    }
}

ActiveTransfers::~ActiveTransfers() { stop_all(); }

TransferRecord ActiveTransfers::Submit(const TransferRequest& request) {
    if (stopped_) {
        throw std::runtime_error("transfer pool is shutting down");
    }

    auto record = orchestrator_->Accept(request);
    if (IsTerminal(record.state)) {
        return record;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.insert(record.id);
        spdlog::debug("[{}] Scheduled ({} running)", record.id, running_.size());
    }

    asio::post(pool_, [this, record]() mutable {
        const auto id = record.id;
        try {
            orchestrator_->Run(std::move(record));
        } catch (const std::exception& e) {
            spdlog::critical("[{}] Transfer aborted: {}", id, e.what());
        }
        on_finished(id);
    });
    return record;
}

std::optional<TransferRecord> ActiveTransfers::Get(const std::string& id) const {
    return orchestrator_->Find(id);
}

std::vector<TransferRecord> ActiveTransfers::History(const std::string& requested_by,
                                                     std::size_t limit) const {
    return orchestrator_->History(requested_by, limit);
}

std::vector<std::string> ActiveTransfers::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {running_.begin(), running_.end()};
}

std::size_t ActiveTransfers::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

void ActiveTransfers::stop_all() {
    if (stopped_.exchange(true)) {
        return;
    }
    spdlog::info("Waiting for {} running transfer(s)", size());
    pool_.join();
}

void ActiveTransfers::on_finished(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(id);
    spdlog::debug("[{}] Removed from active set", id);
}

}  // namespace ferry
