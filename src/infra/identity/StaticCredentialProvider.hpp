#pragma once

#include <chrono>
#include <memory>

#include "Clock.hpp"
#include "ICredentialProvider.hpp"
#include "config.hpp"

namespace ferry {

/**
 * @brief Identity provider backed by the keys in `[identity]`.
 *
 * @details
 * Hands out the configured access key narrowed to one object by scope. The
 * keys are expected to belong to a read-only role on the object store; the
 * scope string is what ends up on the session and in the audit trail.
 * Expiration is `now + lifetime`.
 *
 * **Errors:** FerryError(CredentialIssuanceFailed) when no key is configured.
 */
class StaticCredentialProvider final : public ICredentialProvider {
   public:
    StaticCredentialProvider(IdentityConfig identity, std::string region,
                             std::shared_ptr<Clock> clock,
                             std::chrono::seconds lifetime = std::chrono::minutes(15));

    Credentials IssueEphemeralCredentials(const std::string& subject,
                                          const CredentialScope& scope) override;

   private:
    IdentityConfig identity_;
    std::string region_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds lifetime_;
};

}  // namespace ferry
