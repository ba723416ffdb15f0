#include "Transfer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace ferry {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array kStates{
    std::pair{TransferState::Validating, std::string_view{"Validating"}},
    std::pair{TransferState::Authenticating, std::string_view{"Authenticating"}},
    std::pair{TransferState::Planning, std::string_view{"Planning"}},
    std::pair{TransferState::Transferring, std::string_view{"Transferring"}},
    std::pair{TransferState::Retrying, std::string_view{"Retrying"}},
    std::pair{TransferState::Verifying, std::string_view{"Verifying"}},
    std::pair{TransferState::Recording, std::string_view{"Recording"}},
    std::pair{TransferState::Notifying, std::string_view{"Notifying"}},
    std::pair{TransferState::CleaningUp, std::string_view{"CleaningUp"}},
    std::pair{TransferState::Completed, std::string_view{"Completed"}},
    std::pair{TransferState::Failed, std::string_view{"Failed"}},
};

}  // namespace

std::string_view ToString(Protocol p) noexcept {
    switch (p) {
        case Protocol::Ftp:
            return "ftp";
        case Protocol::Sftp:
            return "sftp";
        case Protocol::Ftps:
            return "ftps";
    }
    return "sftp";
}

std::string_view ToString(StrategyKind s) noexcept {
    switch (s) {
        case StrategyKind::Direct:
            return "direct";
        case StrategyKind::Chunked:
            return "chunked";
        case StrategyKind::ParallelChunked:
            return "parallel-chunked";
    }
    return "direct";
}

std::string_view ToString(TransferState s) noexcept {
    for (const auto& [state, name] : kStates) {
        if (state == s) return name;
    }
    return "Failed";
}

std::optional<Protocol> ParseProtocol(std::string_view name) {
    const auto n = Lower(name);
    if (n == "ftp") return Protocol::Ftp;
    if (n == "sftp" || n == "ssh") return Protocol::Sftp;
    if (n == "ftps" || n == "ftp-tls") return Protocol::Ftps;
    return std::nullopt;
}

std::optional<StrategyKind> ParseStrategy(std::string_view name) {
    if (name == "direct") return StrategyKind::Direct;
    if (name == "chunked") return StrategyKind::Chunked;
    if (name == "parallel-chunked") return StrategyKind::ParallelChunked;
    return std::nullopt;
}

std::optional<TransferState> ParseState(std::string_view name) {
    for (const auto& [state, label] : kStates) {
        if (label == name) return state;
    }
    return std::nullopt;
}

std::uint16_t DefaultPort(Protocol p) noexcept {
    return p == Protocol::Sftp ? 22 : 21;
}

bool IsTerminal(TransferState s) noexcept {
    return s == TransferState::Completed || s == TransferState::Failed;
}

}  // namespace ferry
