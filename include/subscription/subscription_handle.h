// =============================================================================
// FILE: include/subscription/subscription_handle.h
// =============================================================================
#ifndef SUBSCRIPTION_HANDLE_H
#define SUBSCRIPTION_HANDLE_H

#include "common/types.h"
#include "dialog/dialog.h"
#include "handle/handle_codec.h"
#include <string>

namespace sip_subscription {

struct SipMessage;

// External "U_" handles for the things a caller may hold.
class SubscriptionHandles {
public:
    static std::string get_handle(const Subscription& subscription, const Dialog& dialog);

    // Subscription the message belongs to, whether or not it exists yet.
    static std::string get_handle(const SipMessage& message);

    // A string that already is a subscription handle is returned unchanged;
    // anything else is kInvalidSubscription.
    static Result get_handle(const std::string& text, std::string& out);
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_HANDLE_H
