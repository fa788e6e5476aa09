// =============================================================================
// FILE: include/subscription/subscription_finder.h
// =============================================================================
#ifndef SUBSCRIPTION_FINDER_H
#define SUBSCRIPTION_FINDER_H

#include "common/types.h"
#include "dialog/dialog.h"

namespace sip_subscription {

struct SipMessage;

// Lookup of a subscription inside its dialog. nullptr when not present.
class SubscriptionFinder {
public:
    static const Subscription* find(const SubscriptionId& id, const Dialog& dialog);
    static Subscription* find(const SubscriptionId& id, Dialog& dialog);

    static const Subscription* find(const SipMessage& message, const Dialog& dialog);
    static Subscription* find(const SipMessage& message, Dialog& dialog);
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_FINDER_H
