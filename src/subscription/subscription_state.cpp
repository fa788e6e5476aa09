// =============================================================================
// FILE: src/subscription/subscription_state.cpp
// =============================================================================
#include "subscription/subscription_state.h"
#include "sip/sip_message.h"
#include <cctype>
#include <limits>

namespace sip_subscription {

bool SubscriptionStateParser::parse_delta(const HeaderToken& token, const char* param,
                                          std::optional<uint32_t>& out) {
    out.reset();
    const std::string* value = token.find_param(param);
    if (!value) return true;
    if (*value == "-1") return true;
    if (value->empty()) return false;

    // Oversized deltas saturate at 2^32-1 (RFC 3261 section 20).
    const uint64_t max = std::numeric_limits<uint32_t>::max();
    uint64_t n = 0;
    for (char c : *value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        if (n <= max) n = n * 10 + static_cast<uint64_t>(c - '0');
    }

    out = static_cast<uint32_t>(n > max ? max : n);
    return true;
}

SubscriptionState SubscriptionStateParser::parse(const HeaderTokens& tokens) {
    if (tokens.size() != 1) return SubscriptionState::invalid();
    const HeaderToken& token = tokens.front();

    if (token.name == "active" || token.name == "pending") {
        std::optional<uint32_t> expires;
        if (!parse_delta(token, "expires", expires)) return SubscriptionState::invalid();
        return token.name == "active" ? SubscriptionState::active(expires)
                                      : SubscriptionState::pending(expires);
    }

    if (token.name == "terminated") {
        std::optional<uint32_t> retry_after;
        if (!parse_delta(token, "retry-after", retry_after)) return SubscriptionState::invalid();

        std::optional<TerminationReason> reason;
        TerminationReason known;
        const std::string* reason_token = token.find_param("reason");
        if (reason_token && parse_termination_reason(HeaderTokenizer::to_lower(*reason_token), known)) {
            reason = known;
        }
        return SubscriptionState::terminated(reason, retry_after);
    }

    return SubscriptionState::invalid();
}

SubscriptionState SubscriptionStateParser::parse(const SipMessage& message) {
    return parse(message.subscription_state);
}

SubscriptionState SubscriptionStateParser::parse(const std::string& header_value) {
    return parse(HeaderTokenizer::tokenize(header_value));
}

std::string SubscriptionStateParser::render(const SubscriptionState& state) {
    std::string out = state_kind_to_string(state.kind);
    switch (state.kind) {
        case SubscriptionState::Kind::kActive:
        case SubscriptionState::Kind::kPending:
            if (state.expires) out += ";expires=" + std::to_string(*state.expires);
            break;
        case SubscriptionState::Kind::kTerminated:
            if (state.reason) out += std::string(";reason=") + termination_reason_to_string(*state.reason);
            if (state.retry_after) out += ";retry-after=" + std::to_string(*state.retry_after);
            break;
        case SubscriptionState::Kind::kInvalid:
            break;
    }
    return out;
}

} // namespace sip_subscription
