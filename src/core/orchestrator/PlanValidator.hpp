#pragma once

#include <string>

#include "Transfer.hpp"

namespace ferry {

/**
 * @brief Schema and protocol-field checks run in the Validating state.
 *
 * Source existence is not checked here; that needs credentials.
 * @throws FerryError(InvalidPlan) naming the first offending field.
 */
void ValidateRequest(const TransferRequest& request);

/**
 * @brief Destination path for the object. A remote path ending in '/' names a
 * directory and receives the basename of the object key.
 */
std::string ResolveRemotePath(const TransferPlan& plan);

}  // namespace ferry
