#include "StaticCredentialProvider.hpp"

#include <spdlog/spdlog.h>

namespace ferry {

StaticCredentialProvider::StaticCredentialProvider(IdentityConfig identity, std::string region,
                                                   std::shared_ptr<Clock> clock,
                                                   std::chrono::seconds lifetime)
    : identity_(std::move(identity)),
      region_(std::move(region)),
      clock_(std::move(clock)),
      lifetime_(lifetime) {}

Credentials StaticCredentialProvider::IssueEphemeralCredentials(const std::string& subject,
                                                                const CredentialScope& scope) {
    if (identity_.access_key.empty() || identity_.secret_key.empty()) {
        throw FerryError(ErrorCode::CredentialIssuanceFailed,
                         "identity.access_key / identity.secret_key are not configured");
    }

    Credentials credentials;
    credentials.access_key_id = identity_.access_key;
    credentials.secret_access_key = identity_.secret_key;
    credentials.session_token = identity_.session_token;
    credentials.region = region_;
    credentials.scope = scope.ToString();
    credentials.expiration = clock_->Now() + lifetime_;

    spdlog::debug("[IdP] Issued {} for '{}' as {}", credentials.scope, subject, scope.role);
    return credentials;
}

}  // namespace ferry
