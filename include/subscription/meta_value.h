// =============================================================================
// FILE: include/subscription/meta_value.h
// =============================================================================
#ifndef SUBSCRIPTION_META_VALUE_H
#define SUBSCRIPTION_META_VALUE_H

#include "sip/header_tokens.h"
#include "subscription/subscription_state.h"
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sip_subscription {

// Value of one subscription or dialog field. std::monostate is "undefined".
using MetaValue = std::variant<std::monostate, std::string, int64_t, bool,
                               HeaderToken, SubscriptionState>;

// (field name, value) in request order.
using MetaList = std::vector<std::pair<std::string, MetaValue>>;

std::string meta_value_to_string(const MetaValue& value);

} // namespace sip_subscription
#endif // SUBSCRIPTION_META_VALUE_H
