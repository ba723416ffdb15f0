#include "JournalAuditRecorder.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

#include "Errors.hpp"

namespace ferry {

JournalAuditRecorder::JournalAuditRecorder(std::filesystem::path path, std::shared_ptr<Clock> clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

std::string JournalAuditRecorder::RecordOutcome(const std::string& transfer_id,
                                                const TransferOutcome& outcome) {
    std::lock_guard lock(mutex_);

    const auto now = clock_->Now();
    const auto ticket = fmt::format("AUD-{:%Y%m%d}-{:06}",
                                    std::chrono::floor<std::chrono::seconds>(now), sequence_ + 1);

    json::object line;
    line["ticket"] = ticket;
    line["transfer_id"] = transfer_id;
    line["recorded_at"] = ToEpochMillis(now);
    line["success"] = outcome.success;
    line["summary"] = outcome.summary;
    line["detail"] = outcome.detail;

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw FerryError(ErrorCode::AuditFailed,
                             fmt::format("cannot create {}: {}", path_.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw FerryError(ErrorCode::AuditFailed, "cannot open audit journal " + path_.string());
    }
    out << json::serialize(line) << '\n';
    out.flush();
    if (!out) {
        throw FerryError(ErrorCode::AuditFailed, "write to audit journal " + path_.string() + " failed");
    }

    ++sequence_;
    return ticket;
}

void LogNotifier::Notify(const std::string& subject, const std::string& transfer_id,
                         const TransferOutcome& outcome) {
    if (outcome.success) {
        spdlog::info("[Notify] {}: transfer {} {}", subject, transfer_id, outcome.summary);
    } else {
        spdlog::warn("[Notify] {}: transfer {} failed: {}", subject, transfer_id, outcome.summary);
    }
}

}  // namespace ferry
