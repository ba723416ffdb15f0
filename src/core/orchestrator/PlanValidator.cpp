#include "PlanValidator.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "Errors.hpp"

namespace ferry {

namespace {

[[noreturn]] void Reject(const std::string& message) {
    throw FerryError(ErrorCode::InvalidPlan, message);
}

bool IsAlnumLower(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

void CheckContainer(const std::string& container) {
    if (container.size() < 3 || container.size() > 63) {
        Reject("source.container must be 3-63 characters");
    }
    if (!std::all_of(container.begin(), container.end(),
                     [](char c) { return IsAlnumLower(c) || c == '.' || c == '-'; })) {
        Reject("source.container may only contain [a-z0-9.-]");
    }
    if (!IsAlnumLower(container.front()) || !IsAlnumLower(container.back())) {
        Reject("source.container must start and end with a letter or digit");
    }
}

void CheckRemotePath(std::string_view path) {
    if (path.empty()) {
        Reject("destination.remote_path is required");
    }
    std::size_t pos = 0;
    for (;;) {
        const auto slash = path.find('/', pos);
        const auto segment = path.substr(pos, slash == std::string_view::npos ? path.npos : slash - pos);
        if (segment == "..") {
            Reject("destination.remote_path must not contain '..'");
        }
        if (slash == std::string_view::npos) break;
        pos = slash + 1;
    }
}

}  // namespace

void ValidateRequest(const TransferRequest& request) {
    if (request.subject.empty()) Reject("subject is required");
    if (request.approval_reference.empty()) Reject("approval_reference is required");

    const auto& plan = request.plan;
    if (plan.requested_by != request.subject) {
        Reject("transfer_plan.requested_by does not match subject");
    }
    if (plan.approval_reference != request.approval_reference) {
        Reject("transfer_plan.approval_reference does not match approval_reference");
    }

    CheckContainer(plan.source.container);
    if (plan.source.object_key.empty() || plan.source.object_key.size() > 1024) {
        Reject("source.object_key must be 1-1024 bytes");
    }

    const auto& dst = plan.destination;
    if (dst.host.empty() ||
        std::any_of(dst.host.begin(), dst.host.end(),
                    [](unsigned char c) { return std::isspace(c) || c == '/'; })) {
        Reject("destination.host is invalid");
    }
    if (dst.port == 0) {
        Reject("destination.port must be in 1..65535");
    }
    if (dst.credentials.username.empty()) {
        Reject("destination.credentials.username is required");
    }
    if (!dst.credentials.private_key_path.empty() && dst.protocol != Protocol::Sftp) {
        Reject("destination.credentials.private_key_path is only supported for sftp");
    }
    if (dst.credentials.password.empty() && dst.credentials.private_key_path.empty()) {
        Reject("destination.credentials needs a password or a private key");
    }
    CheckRemotePath(dst.remote_path);
}

std::string ResolveRemotePath(const TransferPlan& plan) {
    const auto& path = plan.destination.remote_path;
    if (path.empty() || path.back() != '/') {
        return path;
    }
    const auto& key = plan.source.object_key;
    const auto slash = key.find_last_of('/');
    return path + (slash == std::string::npos ? key : key.substr(slash + 1));
}

}  // namespace ferry
