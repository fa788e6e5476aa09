// =============================================================================
// FILE: src/dialog/dialog_meta.cpp
// =============================================================================
#include "dialog/dialog_meta.h"
#include "handle/handle_codec.h"
#include <unordered_map>

namespace sip_subscription {

namespace {

const std::unordered_map<std::string, DialogField>& field_table() {
    static const std::unordered_map<std::string, DialogField> table = {
        {"id",            DialogField::kId},
        {"internal_id",   DialogField::kInternalId},
        {"service_id",    DialogField::kServiceId},
        {"call_id",       DialogField::kCallId},
        {"local_tag",     DialogField::kLocalTag},
        {"remote_tag",    DialogField::kRemoteTag},
        {"local_uri",     DialogField::kLocalUri},
        {"remote_uri",    DialogField::kRemoteUri},
        {"local_target",  DialogField::kLocalTarget},
        {"remote_target", DialogField::kRemoteTarget},
        {"local_seq",     DialogField::kLocalSeq},
        {"remote_seq",    DialogField::kRemoteSeq},
        {"created",       DialogField::kCreated},
        {"updated",       DialogField::kUpdated},
        {"subscriptions", DialogField::kSubscriptions},
    };
    return table;
}

} // namespace

bool DialogMeta::parse_field(const std::string& name, DialogField& out) {
    auto it = field_table().find(name);
    if (it == field_table().end()) return false;
    out = it->second;
    return true;
}

const char* DialogMeta::field_name(DialogField field) {
    switch (field) {
        case DialogField::kId:            return "id";
        case DialogField::kInternalId:    return "internal_id";
        case DialogField::kServiceId:     return "service_id";
        case DialogField::kCallId:        return "call_id";
        case DialogField::kLocalTag:      return "local_tag";
        case DialogField::kRemoteTag:     return "remote_tag";
        case DialogField::kLocalUri:      return "local_uri";
        case DialogField::kRemoteUri:     return "remote_uri";
        case DialogField::kLocalTarget:   return "local_target";
        case DialogField::kRemoteTarget:  return "remote_target";
        case DialogField::kLocalSeq:      return "local_seq";
        case DialogField::kRemoteSeq:     return "remote_seq";
        case DialogField::kCreated:       return "created";
        case DialogField::kUpdated:       return "updated";
        case DialogField::kSubscriptions: return "subscriptions";
        default:                          return "unknown";
    }
}

std::string DialogMeta::handle(const Dialog& dialog) {
    return HandleCodec::encode(DialogHandle{dialog.service_id, dialog.id, dialog.call_id});
}

MetaValue DialogMeta::get(DialogField field, const Dialog& dialog) {
    switch (field) {
        case DialogField::kId:            return handle(dialog);
        case DialogField::kInternalId:    return dialog.id;
        case DialogField::kServiceId:     return dialog.service_id;
        case DialogField::kCallId:        return dialog.call_id;
        case DialogField::kLocalTag:      return dialog.local_tag;
        case DialogField::kRemoteTag:     return dialog.remote_tag;
        case DialogField::kLocalUri:      return dialog.local_uri;
        case DialogField::kRemoteUri:     return dialog.remote_uri;
        case DialogField::kLocalTarget:   return dialog.local_target;
        case DialogField::kRemoteTarget:  return dialog.remote_target;
        case DialogField::kLocalSeq:      return static_cast<int64_t>(dialog.local_seq);
        case DialogField::kRemoteSeq:     return static_cast<int64_t>(dialog.remote_seq);
        case DialogField::kCreated:       return dialog.created;
        case DialogField::kUpdated:       return dialog.updated;
        case DialogField::kSubscriptions: return static_cast<int64_t>(dialog.subscriptions.size());
    }
    return std::monostate{};
}

Result DialogMeta::get(const std::string& name, const Dialog& dialog, MetaValue& out) {
    DialogField field;
    if (!parse_field(name, field)) return Result::kInvalidField;
    out = get(field, dialog);
    return Result::kOk;
}

} // namespace sip_subscription
