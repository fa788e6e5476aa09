// =============================================================================
// FILE: src/subscription/subscription_handle.cpp
// =============================================================================
#include "subscription/subscription_handle.h"
#include "subscription/subscription_id.h"
#include "sip/sip_message.h"

namespace sip_subscription {

std::string SubscriptionHandles::get_handle(const Subscription& subscription, const Dialog& dialog) {
    return HandleCodec::encode(SubscriptionHandle{
        dialog.service_id, subscription.id, dialog.id, dialog.call_id});
}

std::string SubscriptionHandles::get_handle(const SipMessage& message) {
    return HandleCodec::encode(SubscriptionHandle{
        message.service_id, SubscriptionIdDeriver::derive(message),
        message.dialog_id, message.call_id});
}

Result SubscriptionHandles::get_handle(const std::string& text, std::string& out) {
    if (HandleCodec::classify(text) != HandleKind::kSubscription) {
        return Result::kInvalidSubscription;
    }
    out = text;
    return Result::kOk;
}

} // namespace sip_subscription
