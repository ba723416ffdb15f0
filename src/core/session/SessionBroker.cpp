#include "SessionBroker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

#include "TransferJson.hpp"

namespace ferry {

std::string ShortToken(const std::string& token) {
    return token.substr(0, 8) + "...";
}

SessionBroker::SessionBroker(std::shared_ptr<IKeyValueStore> store,
                             std::shared_ptr<ICredentialProvider> provider,
                             std::shared_ptr<Clock> clock, BrokerConfig cfg, std::string role)
    : store_(std::move(store)),
      provider_(std::move(provider)),
      clock_(std::move(clock)),
      cfg_(std::move(cfg)),
      role_(std::move(role)),
      approval_format_(cfg_.approval_pattern) {
    if (!store_ || !provider_ || !clock_) {
        throw std::invalid_argument("SessionBroker: store, provider and clock are required");
    }
}

bool SessionBroker::IsWellFormed(const std::string& approval_reference) const {
    return std::regex_match(approval_reference, approval_format_);
}

Session SessionBroker::Authenticate(const std::string& subject,
                                    const std::string& approval_reference,
                                    const SourceLocation& scope) {
    spdlog::info("[SSO] Authenticating: subject={}, approval={}", subject, approval_reference);

    // 1. Format check
    if (subject.empty() || !IsWellFormed(approval_reference)) {
        spdlog::error("[SSO] Invalid approval reference: '{}'", approval_reference);
        throw FerryError(ErrorCode::ApprovalInvalid,
                         "Approval reference is malformed: " + approval_reference);
    }

    // 2. Claim the approval. Consumed or active references are both rejected here.
    if (!store_->ConsumeIfUnused(ApprovalKey(approval_reference), cfg_.approval_retention)) {
        spdlog::warn("[SSO] Approval already used: {}", approval_reference);
        throw FerryError(ErrorCode::ReplayDetected,
                         "Approval " + approval_reference + " already used. A new approval is required.");
    }

    // 3. Ephemeral credentials. The window starts when the approval is claimed.
    const auto issued_at = clock_->Now();
    const auto expires_at = issued_at + cfg_.session_ttl;

    Credentials credentials;
    try {
        credentials = provider_->IssueEphemeralCredentials(
            subject, CredentialScope{scope.container, scope.object_key, role_});
    } catch (const FerryError& e) {
        // Nothing was issued: release the claim so the same approval may be retried.
        store_->Delete(ApprovalKey(approval_reference));
        spdlog::warn("[SSO] Credential issuance failed ({}): {}", ToString(e.code()), e.what());
        throw;
    } catch (const std::exception& e) {
        store_->Delete(ApprovalKey(approval_reference));
        throw FerryError(ErrorCode::CredentialIssuanceFailed,
                         std::string("Identity provider error: ") + e.what());
    }

    // 4. Credentials arriving after the window closed are never handed out.
    const auto now = clock_->Now();
    if (now >= expires_at) {
        spdlog::error("[SSO] Session window elapsed before credentials arrived ({} ms late)",
                      std::chrono::duration_cast<std::chrono::milliseconds>(now - expires_at).count());
        throw FerryError(ErrorCode::SessionExpired,
                         "Session window elapsed during authentication; a fresh approval is required");
    }

    Session session;
    session.token = boost::uuids::to_string(boost::uuids::random_generator()());
    session.subject = subject;
    session.approval_reference = approval_reference;
    session.issued_at = issued_at;
    session.expires_at = expires_at;
    session.credentials = std::move(credentials);
    session.credentials.scope = CredentialScope{scope.container, scope.object_key, role_}.ToString();

    // 5. Persist with the remaining window as TTL.
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - now);
    store_->Put(SessionKey(session.token), json::serialize(json::value_from(session)), remaining);

    spdlog::info("[SSO] Session created: {} (expires in {} ms)", ShortToken(session.token),
                 remaining.count());
    return session;
}

std::optional<Session> SessionBroker::Load(const std::string& token) {
    auto raw = store_->Get(SessionKey(token));
    if (!raw) {
        return std::nullopt;
    }
    Session session;
    try {
        session = json::value_to<Session>(json::parse(*raw));
    } catch (const std::exception& e) {
        spdlog::error("[SSO] Corrupt session record {}: {}", ShortToken(token), e.what());
        return std::nullopt;
    }
    session.consumed = store_->Get(ConsumedKey(token)).has_value();
    return session;
}

Session SessionBroker::LoadLive(const std::string& token) {
    auto session = Load(token);
    if (!session) {
        throw FerryError(ErrorCode::SessionNotFound, "Session not found: " + ShortToken(token));
    }
    if (clock_->Now() >= session->expires_at) {
        throw FerryError(ErrorCode::SessionExpired, "Session expired: " + ShortToken(token));
    }
    return *session;
}

bool SessionBroker::IsValid(const std::string& token) {
    auto session = Load(token);
    return session && session->ValidAt(clock_->Now());
}

Credentials SessionBroker::CredentialsFor(const std::string& token) {
    auto session = LoadLive(token);
    if (session.consumed) {
        throw FerryError(ErrorCode::SessionExpired, "Session already consumed: " + ShortToken(token));
    }
    return session.credentials;
}

Credentials SessionBroker::Consume(const std::string& token) {
    auto session = LoadLive(token);
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(session.expires_at - clock_->Now());
    if (!store_->ConsumeIfUnused(ConsumedKey(token), std::max(remaining, std::chrono::milliseconds{1}))) {
        spdlog::warn("[SSO] Second consume attempt on {}", ShortToken(token));
        throw FerryError(ErrorCode::ReplayDetected, "Session already consumed: " + ShortToken(token));
    }
    spdlog::debug("[SSO] Session consumed: {}", ShortToken(token));
    return session.credentials;
}

void SessionBroker::Invalidate(const std::string& token) {
    if (token.empty()) {
        return;
    }
    if (!store_->ConsumeIfUnused(ConsumedKey(token), cfg_.session_ttl)) {
        spdlog::debug("[SSO] Session {} was already consumed", ShortToken(token));
    }
    store_->Delete(SessionKey(token));
    spdlog::info("[SSO] Logged out: {}", ShortToken(token));
}

}  // namespace ferry
