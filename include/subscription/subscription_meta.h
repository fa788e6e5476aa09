// =============================================================================
// FILE: include/subscription/subscription_meta.h
// =============================================================================
#ifndef SUBSCRIPTION_META_H
#define SUBSCRIPTION_META_H

#include "common/types.h"
#include "dialog/dialog.h"
#include "subscription/meta_value.h"
#include <string>
#include <vector>

namespace sip_subscription {

enum class SubscriptionField {
    kId, kInternalId, kStatus, kEvent, kRawEvent, kClass, kAnswered, kExpires
};

// Field access on a live subscription. Names that are not subscription
// fields are looked up on the owning dialog (see DialogMeta).
//
//   id          "U_" handle
//   internal_id subscription id
//   status      SubscriptionState
//   event       HeaderToken
//   raw_event   "pkg;param=value"
//   class       "subscribe" | "refer"
//   answered    bool
//   expires     whole seconds until the expiry timer fires, rounded and
//               never negative; undefined without a timer
class SubscriptionMeta {
public:
    static bool parse_field(const std::string& name, SubscriptionField& out);
    static const char* field_name(SubscriptionField field);

    static MetaValue get(SubscriptionField field, const Subscription& subscription,
                         const Dialog& dialog, TimePoint now = Clock::now());

    // kInvalidField when neither a subscription nor a dialog field.
    static Result get(const std::string& name, const Subscription& subscription,
                      const Dialog& dialog, MetaValue& out);

    // Same order as `names`, duplicates kept. Stops at the first unknown name.
    static Result get_all(const std::vector<std::string>& names, const Subscription& subscription,
                          const Dialog& dialog, MetaList& out);

private:
    static MetaValue remaining_seconds(const Subscription& subscription, TimePoint now);
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_META_H
