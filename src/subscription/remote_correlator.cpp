// =============================================================================
// FILE: src/subscription/remote_correlator.cpp
// =============================================================================
#include "subscription/remote_correlator.h"
#include "dialog/dialog_remote_id.h"
#include "dispatch/call_dispatcher.h"
#include "handle/handle_codec.h"

namespace sip_subscription {

Result RemoteCorrelator::remote_handle(const std::string& handle, std::string& out) const {
    SubscriptionHandle local;
    Result r = HandleCodec::decode(handle, local);
    if (r != Result::kOk) return r;
    return remote_handle(handle, local.service_id, out);
}

Result RemoteCorrelator::remote_handle(const std::string& handle,
                                       const ServiceId& remote_service_id,
                                       std::string& out) const {
    SubscriptionHandle local;
    Result r = HandleCodec::decode(handle, local);
    if (r != Result::kOk) return r;

    std::string local_dialog = HandleCodec::encode(
        DialogHandle{local.service_id, local.dialog_id, local.call_id});
    std::string remote_dialog;
    r = DialogRemoteId::resolve(dispatcher_, local_dialog, remote_service_id, remote_dialog);
    if (r != Result::kOk) return r;

    DialogHandle remote;
    r = HandleCodec::decode(remote_dialog, remote);
    if (r != Result::kOk) return r;

    out = HandleCodec::encode(SubscriptionHandle{
        remote.service_id, local.subscription_id, remote.dialog_id, remote.call_id});
    return Result::kOk;
}

} // namespace sip_subscription
