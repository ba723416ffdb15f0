#pragma once

#include <boost/json.hpp>

#include "Transfer.hpp"
#include "types.hpp"

namespace ferry {

// Session records keep the ephemeral credentials; they only ever live in the
// short-TTL session store.
void tag_invoke(json::value_from_tag, json::value& jv, const Credentials& c);
Credentials tag_invoke(json::value_to_tag<Credentials>, const json::value& jv);

void tag_invoke(json::value_from_tag, json::value& jv, const Session& s);
Session tag_invoke(json::value_to_tag<Session>, const json::value& jv);

// Transfer records never carry destination secrets: password and private key
// path are dropped on serialization.
void tag_invoke(json::value_from_tag, json::value& jv, const TransferPlan& p);
TransferPlan tag_invoke(json::value_to_tag<TransferPlan>, const json::value& jv);

void tag_invoke(json::value_from_tag, json::value& jv, const TransferRecord& r);
TransferRecord tag_invoke(json::value_to_tag<TransferRecord>, const json::value& jv);

/**
 * @brief Parses the intake envelope {subject, approval_reference, transfer_plan}.
 *
 * Fills plan.requested_by / plan.approval_reference from the envelope when the
 * plan omits them and defaults the port from the protocol. Field checks beyond
 * shape and type belong to plan validation.
 *
 * @throws FerryError(InvalidPlan) on missing keys or wrong types.
 */
TransferRequest ParseTransferRequest(const json::object& o);

}  // namespace ferry
