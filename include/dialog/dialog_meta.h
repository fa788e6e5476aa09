// =============================================================================
// FILE: include/dialog/dialog_meta.h
// =============================================================================
#ifndef DIALOG_META_H
#define DIALOG_META_H

#include "common/types.h"
#include "dialog/dialog.h"
#include "subscription/meta_value.h"
#include <string>

namespace sip_subscription {

enum class DialogField {
    kId, kInternalId, kServiceId, kCallId,
    kLocalTag, kRemoteTag, kLocalUri, kRemoteUri,
    kLocalTarget, kRemoteTarget, kLocalSeq, kRemoteSeq,
    kCreated, kUpdated, kSubscriptions
};

// Read access to dialog fields by external name ("call_id", "local_seq", ...).
class DialogMeta {
public:
    static bool parse_field(const std::string& name, DialogField& out);
    static const char* field_name(DialogField field);

    static MetaValue get(DialogField field, const Dialog& dialog);

    // kInvalidField for a name that is not a dialog field.
    static Result get(const std::string& name, const Dialog& dialog, MetaValue& out);

    // External "D_" handle of a live dialog.
    static std::string handle(const Dialog& dialog);
};

} // namespace sip_subscription
#endif // DIALOG_META_H
