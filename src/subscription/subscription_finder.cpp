// =============================================================================
// FILE: src/subscription/subscription_finder.cpp
// =============================================================================
#include "subscription/subscription_finder.h"
#include "subscription/subscription_id.h"
#include "sip/sip_message.h"
#include <algorithm>

namespace sip_subscription {

const Subscription* SubscriptionFinder::find(const SubscriptionId& id, const Dialog& dialog) {
    auto it = std::find_if(dialog.subscriptions.begin(), dialog.subscriptions.end(),
                           [&id](const Subscription& s) { return s.id == id; });
    return it != dialog.subscriptions.end() ? &*it : nullptr;
}

Subscription* SubscriptionFinder::find(const SubscriptionId& id, Dialog& dialog) {
    auto it = std::find_if(dialog.subscriptions.begin(), dialog.subscriptions.end(),
                           [&id](const Subscription& s) { return s.id == id; });
    return it != dialog.subscriptions.end() ? &*it : nullptr;
}

const Subscription* SubscriptionFinder::find(const SipMessage& message, const Dialog& dialog) {
    return find(SubscriptionIdDeriver::derive(message), dialog);
}

Subscription* SubscriptionFinder::find(const SipMessage& message, Dialog& dialog) {
    return find(SubscriptionIdDeriver::derive(message), dialog);
}

} // namespace sip_subscription
