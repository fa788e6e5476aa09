// =============================================================================
// FILE: src/subscription/subscription_query.cpp
// =============================================================================
#include "subscription/subscription_query.h"
#include "subscription/subscription_finder.h"
#include "subscription/subscription_meta.h"
#include "dispatch/call_dispatcher.h"
#include "handle/handle_codec.h"

namespace sip_subscription {

Result SubscriptionQuery::remote_meta(const std::string& field, const std::string& handle,
                                      MetaValue& out) const {
    MetaList values;
    Result r = remote_metas({field}, handle, values);
    if (r != Result::kOk) return r;
    out = std::move(values.front().second);
    return Result::kOk;
}

Result SubscriptionQuery::remote_metas(const std::vector<std::string>& fields,
                                       const std::string& handle, MetaList& out) const {
    SubscriptionHandle h;
    Result r = HandleCodec::decode(handle, h);
    if (r != Result::kOk) return r;

    MetaList values;
    r = dispatcher_.apply_dialog(h.service_id, h.call_id, h.dialog_id,
        [&h, &fields, &values](Dialog& dialog) {
            const Subscription* sub = SubscriptionFinder::find(h.subscription_id, dialog);
            if (!sub) return Result::kInvalidSubscription;
            return SubscriptionMeta::get_all(fields, *sub, dialog, values);
        });
    if (r != Result::kOk) return r;

    out.swap(values);
    return Result::kOk;
}

} // namespace sip_subscription
