// =============================================================================
// FILE: include/handle/handle_codec.h
// =============================================================================
#ifndef HANDLE_CODEC_H
#define HANDLE_CODEC_H

#include "common/types.h"
#include <string>

namespace sip_subscription {

// Every external handle starts with a two character discriminator.
enum class HandleKind { kUnknown, kRequest, kResponse, kDialog, kSubscription };

inline const char* handle_kind_to_string(HandleKind k) {
    switch (k) {
        case HandleKind::kRequest:      return "request";
        case HandleKind::kResponse:     return "response";
        case HandleKind::kDialog:       return "dialog";
        case HandleKind::kSubscription: return "subscription";
        case HandleKind::kUnknown:      return "unknown";
        default:                        return "invalid";
    }
}

// Addresses one subscription without holding any live state.
struct SubscriptionHandle {
    ServiceId      service_id;
    SubscriptionId subscription_id;
    DialogId       dialog_id;
    CallId         call_id;

    bool operator==(const SubscriptionHandle& o) const {
        return service_id == o.service_id && subscription_id == o.subscription_id &&
               dialog_id == o.dialog_id && call_id == o.call_id;
    }
    bool operator!=(const SubscriptionHandle& o) const { return !(*this == o); }
};

struct DialogHandle {
    ServiceId service_id;
    DialogId  dialog_id;
    CallId    call_id;

    bool operator==(const DialogHandle& o) const {
        return service_id == o.service_id && dialog_id == o.dialog_id && call_id == o.call_id;
    }
    bool operator!=(const DialogHandle& o) const { return !(*this == o); }
};

// Handle text: <prefix> base64(BSON tuple of the handle fields).
// Decoding is all or nothing: a bad prefix, bad base64, a malformed document
// or the wrong number/type of elements all give kInvalidHandle.
class HandleCodec {
public:
    static constexpr const char* kRequestPrefix      = "R_";
    static constexpr const char* kResponsePrefix     = "S_";
    static constexpr const char* kDialogPrefix       = "D_";
    static constexpr const char* kSubscriptionPrefix = "U_";

    static HandleKind classify(const std::string& handle);

    static std::string encode(const SubscriptionHandle& handle);
    static Result decode(const std::string& text, SubscriptionHandle& out);

    static std::string encode(const DialogHandle& handle);
    static Result decode(const std::string& text, DialogHandle& out);

private:
    static bool has_prefix(const std::string& text, const char* prefix);
};

} // namespace sip_subscription
#endif // HANDLE_CODEC_H
