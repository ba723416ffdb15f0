#pragma once

#include <chrono>
#include <memory>
#include <regex>
#include <string>

#include "Clock.hpp"
#include "ICredentialProvider.hpp"
#include "IKeyValueStore.hpp"
#include "Transfer.hpp"
#include "config.hpp"

namespace ferry {

/**
 * @brief Issues single-use, time-boxed sessions bound to one approval reference.
 *
 * @details
 * **State:** Everything lives in the key-value store:
 * - `approval/<ref>`          claim marker, long retention
 * - `session/<token>`         session record, TTL = session window
 * - `session-consumed/<token>` consumption marker
 *
 * No operation ever extends a session's expiry.
 * **Thread Safety:** Stateless apart from the store; safe to share between
 * concurrently running transfers.
 */
class SessionBroker {
   public:
    SessionBroker(std::shared_ptr<IKeyValueStore> store,
                  std::shared_ptr<ICredentialProvider> provider,
                  std::shared_ptr<Clock> clock,
                  BrokerConfig cfg = {},
                  std::string role = "ferry-readonly");

    /**
     * @brief Claims the approval reference and mints a session.
     * @param scope Source object the credentials are narrowed to.
     * @throws FerryError ApprovalInvalid, ReplayDetected, ProviderUnavailable,
     *         CredentialIssuanceFailed, SessionExpired.
     */
    Session Authenticate(const std::string& subject, const std::string& approval_reference,
                         const SourceLocation& scope);

    bool IsValid(const std::string& token);

    /**
     * @brief Credentials of a live, unconsumed session. Does not consume it.
     * @throws FerryError SessionNotFound, SessionExpired.
     */
    Credentials CredentialsFor(const std::string& token);

    /**
     * @brief Atomic consume-and-check. Succeeds once per session.
     * @throws FerryError SessionNotFound, SessionExpired, ReplayDetected.
     */
    Credentials Consume(const std::string& token);

    // Idempotent. Marks consumed and deletes the record without waiting for the TTL.
    void Invalidate(const std::string& token);

    bool IsWellFormed(const std::string& approval_reference) const;
    std::chrono::seconds session_ttl() const { return cfg_.session_ttl; }

   private:
    std::optional<Session> Load(const std::string& token);
    Session LoadLive(const std::string& token);

    static std::string ApprovalKey(const std::string& ref) { return "approval/" + ref; }
    static std::string SessionKey(const std::string& token) { return "session/" + token; }
    static std::string ConsumedKey(const std::string& token) { return "session-consumed/" + token; }

    std::shared_ptr<IKeyValueStore> store_;
    std::shared_ptr<ICredentialProvider> provider_;
    std::shared_ptr<Clock> clock_;
    BrokerConfig cfg_;
    std::string role_;
    std::regex approval_format_;
};

// First 8 characters, for logs.
std::string ShortToken(const std::string& token);

}  // namespace ferry
