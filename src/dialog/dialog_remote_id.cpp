// =============================================================================
// FILE: src/dialog/dialog_remote_id.cpp
// =============================================================================
#include "dialog/dialog_remote_id.h"
#include "dispatch/call_dispatcher.h"
#include "handle/handle_codec.h"
#include "sip/sip_dialog_id.h"

namespace sip_subscription {

Result DialogRemoteId::resolve(CallDispatcher& dispatcher, const std::string& dialog_handle,
                               const ServiceId& remote_service_id, std::string& out) {
    DialogHandle local;
    Result r = HandleCodec::decode(dialog_handle, local);
    if (r != Result::kOk) return r;

    DialogId remote_id;
    r = dispatcher.apply_dialog(local.service_id, local.call_id, local.dialog_id,
        [&remote_id](Dialog& dialog) {
            remote_id = DialogIdBuilder::build_remote(dialog.call_id, dialog.local_tag,
                                                      dialog.remote_tag);
            return Result::kOk;
        });
    if (r != Result::kOk) return r;

    out = HandleCodec::encode(DialogHandle{remote_service_id, remote_id, local.call_id});
    return Result::kOk;
}

} // namespace sip_subscription
