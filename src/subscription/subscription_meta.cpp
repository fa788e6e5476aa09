// =============================================================================
// FILE: src/subscription/subscription_meta.cpp
// =============================================================================
#include "subscription/subscription_meta.h"
#include "subscription/subscription_handle.h"
#include "dialog/dialog_meta.h"
#include <unordered_map>

namespace sip_subscription {

namespace {

const std::unordered_map<std::string, SubscriptionField>& field_table() {
    static const std::unordered_map<std::string, SubscriptionField> table = {
        {"id",          SubscriptionField::kId},
        {"internal_id", SubscriptionField::kInternalId},
        {"status",      SubscriptionField::kStatus},
        {"event",       SubscriptionField::kEvent},
        {"raw_event",   SubscriptionField::kRawEvent},
        {"class",       SubscriptionField::kClass},
        {"answered",    SubscriptionField::kAnswered},
        {"expires",     SubscriptionField::kExpires},
    };
    return table;
}

} // namespace

bool SubscriptionMeta::parse_field(const std::string& name, SubscriptionField& out) {
    auto it = field_table().find(name);
    if (it == field_table().end()) return false;
    out = it->second;
    return true;
}

const char* SubscriptionMeta::field_name(SubscriptionField field) {
    switch (field) {
        case SubscriptionField::kId:         return "id";
        case SubscriptionField::kInternalId: return "internal_id";
        case SubscriptionField::kStatus:     return "status";
        case SubscriptionField::kEvent:      return "event";
        case SubscriptionField::kRawEvent:   return "raw_event";
        case SubscriptionField::kClass:      return "class";
        case SubscriptionField::kAnswered:   return "answered";
        case SubscriptionField::kExpires:    return "expires";
        default:                             return "unknown";
    }
}

MetaValue SubscriptionMeta::remaining_seconds(const Subscription& subscription, TimePoint now) {
    if (!subscription.expiry_timer) return std::monostate{};

    auto ms = std::chrono::duration_cast<Millisecs>(subscription.expiry_timer->fires_at - now).count();
    if (ms <= 0) return static_cast<int64_t>(0);
    return static_cast<int64_t>((ms + 500) / 1000);
}

MetaValue SubscriptionMeta::get(SubscriptionField field, const Subscription& subscription,
                                const Dialog& dialog, TimePoint now) {
    switch (field) {
        case SubscriptionField::kId:
            return SubscriptionHandles::get_handle(subscription, dialog);
        case SubscriptionField::kInternalId:
            return subscription.id;
        case SubscriptionField::kStatus:
            return subscription.status;
        case SubscriptionField::kEvent:
            return subscription.event;
        case SubscriptionField::kRawEvent:
            return HeaderTokenizer::render(subscription.event);
        case SubscriptionField::kClass:
            return std::string(subscription_class_to_string(subscription.subscription_class));
        case SubscriptionField::kAnswered:
            return subscription.answered;
        case SubscriptionField::kExpires:
            return remaining_seconds(subscription, now);
    }
    return std::monostate{};
}

Result SubscriptionMeta::get(const std::string& name, const Subscription& subscription,
                             const Dialog& dialog, MetaValue& out) {
    SubscriptionField field;
    if (parse_field(name, field)) {
        out = get(field, subscription, dialog);
        return Result::kOk;
    }
    return DialogMeta::get(name, dialog, out);
}

Result SubscriptionMeta::get_all(const std::vector<std::string>& names,
                                 const Subscription& subscription,
                                 const Dialog& dialog, MetaList& out) {
    MetaList values;
    values.reserve(names.size());
    TimePoint now = Clock::now();

    for (const auto& name : names) {
        SubscriptionField field;
        if (parse_field(name, field)) {
            values.emplace_back(name, get(field, subscription, dialog, now));
            continue;
        }
        MetaValue value;
        Result r = DialogMeta::get(name, dialog, value);
        if (r != Result::kOk) return r;
        values.emplace_back(name, std::move(value));
    }
    out.swap(values);
    return Result::kOk;
}

} // namespace sip_subscription
