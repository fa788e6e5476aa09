// =============================================================================
// FILE: src/subscription/meta_value.cpp
// =============================================================================
#include "subscription/meta_value.h"

namespace sip_subscription {

std::string meta_value_to_string(const MetaValue& value) {
    if (std::holds_alternative<std::string>(value)) return std::get<std::string>(value);
    if (std::holds_alternative<int64_t>(value))     return std::to_string(std::get<int64_t>(value));
    if (std::holds_alternative<bool>(value))        return std::get<bool>(value) ? "true" : "false";
    if (std::holds_alternative<HeaderToken>(value)) {
        return HeaderTokenizer::render(std::get<HeaderToken>(value));
    }
    if (std::holds_alternative<SubscriptionState>(value)) {
        return SubscriptionStateParser::render(std::get<SubscriptionState>(value));
    }
    return "undefined";
}

} // namespace sip_subscription
