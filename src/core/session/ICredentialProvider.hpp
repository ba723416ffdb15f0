#pragma once

#include <string>

#include "Transfer.hpp"

namespace ferry {

/**
 * @brief Requested access for one session: read-only on exactly one object.
 */
struct CredentialScope {
    std::string source_container;
    std::string source_key;
    std::string role;

    std::string ToString() const { return "read-only:" + source_container + "/" + source_key; }
};

/**
 * @brief Contract for the external identity provider.
 *
 * **Errors:** FerryError(ProviderUnavailable) when the provider cannot be
 * reached (retried by the orchestrator); FerryError(CredentialIssuanceFailed)
 * when it refuses to issue.
 */
struct ICredentialProvider {
    virtual ~ICredentialProvider() = default;

    virtual Credentials IssueEphemeralCredentials(const std::string& subject,
                                                  const CredentialScope& scope) = 0;
};

}  // namespace ferry
