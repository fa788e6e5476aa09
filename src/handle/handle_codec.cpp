// =============================================================================
// FILE: src/handle/handle_codec.cpp
// =============================================================================
#include "handle/handle_codec.h"
#include "common/base64.h"
#include "common/bson_tuple.h"
#include <vector>

namespace sip_subscription {

namespace {

// Decodes the payload after the prefix into exactly `arity` strings.
bool decode_payload(const std::string& text, size_t arity, std::vector<std::string>& out) {
    std::string raw;
    if (!Base64::decode(text.substr(2), raw)) return false;

    std::vector<TupleField> fields;
    if (!BsonTuple::decode(raw, fields) || fields.size() != arity) return false;

    std::vector<std::string> values;
    values.reserve(arity);
    for (auto& f : fields) {
        if (!f) return false;
        values.push_back(std::move(*f));
    }
    out.swap(values);
    return true;
}

} // namespace

bool HandleCodec::has_prefix(const std::string& text, const char* prefix) {
    return text.size() >= 2 && text[0] == prefix[0] && text[1] == prefix[1];
}

HandleKind HandleCodec::classify(const std::string& handle) {
    if (has_prefix(handle, kSubscriptionPrefix)) return HandleKind::kSubscription;
    if (has_prefix(handle, kDialogPrefix))       return HandleKind::kDialog;
    if (has_prefix(handle, kRequestPrefix))      return HandleKind::kRequest;
    if (has_prefix(handle, kResponsePrefix))     return HandleKind::kResponse;
    return HandleKind::kUnknown;
}

std::string HandleCodec::encode(const SubscriptionHandle& h) {
    std::string raw = BsonTuple::encode({h.service_id, h.subscription_id, h.dialog_id, h.call_id});
    return std::string(kSubscriptionPrefix) + Base64::encode(raw);
}

Result HandleCodec::decode(const std::string& text, SubscriptionHandle& out) {
    if (!has_prefix(text, kSubscriptionPrefix)) return Result::kInvalidHandle;

    std::vector<std::string> v;
    if (!decode_payload(text, 4, v)) return Result::kInvalidHandle;

    out.service_id      = std::move(v[0]);
    out.subscription_id = std::move(v[1]);
    out.dialog_id       = std::move(v[2]);
    out.call_id         = std::move(v[3]);
    return Result::kOk;
}

std::string HandleCodec::encode(const DialogHandle& h) {
    std::string raw = BsonTuple::encode({h.service_id, h.dialog_id, h.call_id});
    return std::string(kDialogPrefix) + Base64::encode(raw);
}

Result HandleCodec::decode(const std::string& text, DialogHandle& out) {
    if (!has_prefix(text, kDialogPrefix)) return Result::kInvalidHandle;

    std::vector<std::string> v;
    if (!decode_payload(text, 3, v)) return Result::kInvalidHandle;

    out.service_id = std::move(v[0]);
    out.dialog_id  = std::move(v[1]);
    out.call_id    = std::move(v[2]);
    return Result::kOk;
}

} // namespace sip_subscription
