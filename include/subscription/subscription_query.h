// =============================================================================
// FILE: include/subscription/subscription_query.h
// =============================================================================
#ifndef SUBSCRIPTION_QUERY_H
#define SUBSCRIPTION_QUERY_H

#include "common/types.h"
#include "subscription/meta_value.h"
#include <string>
#include <vector>

namespace sip_subscription {

class CallDispatcher;

// Field reads on a subscription addressed by its "U_" handle. Runs on the
// worker that owns the call.
//
//   kInvalidHandle       handle does not decode
//   kNotFound            call or dialog is gone
//   kInvalidSubscription dialog exists, subscription does not
//   kInvalidField        name unknown to both subscription and dialog
class SubscriptionQuery {
public:
    explicit SubscriptionQuery(CallDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    Result remote_meta(const std::string& field, const std::string& handle,
                       MetaValue& out) const;
    Result remote_metas(const std::vector<std::string>& fields, const std::string& handle,
                        MetaList& out) const;

private:
    CallDispatcher& dispatcher_;
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_QUERY_H
