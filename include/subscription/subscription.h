// =============================================================================
// FILE: include/subscription/subscription.h
// =============================================================================
#ifndef SUBSCRIPTION_SUBSCRIPTION_H
#define SUBSCRIPTION_SUBSCRIPTION_H

#include "common/types.h"
#include "sip/header_tokens.h"
#include "subscription/subscription_state.h"
#include <cstdint>
#include <optional>
#include <string>

namespace sip_subscription {

enum class SubscriptionClass {
    kSubscribe,  // explicit SUBSCRIBE
    kRefer       // implicit, created by a REFER
};

inline const char* subscription_class_to_string(SubscriptionClass c) {
    switch (c) {
        case SubscriptionClass::kSubscribe: return "subscribe";
        case SubscriptionClass::kRefer:     return "refer";
        default:                            return "unknown";
    }
}

struct ExpiryTimer {
    uint64_t  timer_id = 0;
    TimePoint fires_at;
};

// One event subscription inside a dialog. Owned by the Dialog; only the
// worker owning the call reads or changes it.
struct Subscription {
    SubscriptionId    id;
    SubscriptionState status = SubscriptionState::pending();
    bool              answered = false;   // initial NOTIFY seen
    HeaderToken       event;              // package token and its params
    SubscriptionClass subscription_class = SubscriptionClass::kSubscribe;
    std::optional<ExpiryTimer> expiry_timer;
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_SUBSCRIPTION_H
