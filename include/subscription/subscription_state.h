// =============================================================================
// FILE: include/subscription/subscription_state.h
// =============================================================================
#ifndef SUBSCRIPTION_STATE_H
#define SUBSCRIPTION_STATE_H

#include "sip/header_tokens.h"
#include <cstdint>
#include <optional>
#include <string>

namespace sip_subscription {

struct SipMessage;

// Termination reasons this layer knows about. Any other reason token in a
// Subscription-State header is treated as if no reason had been given.
enum class TerminationReason {
    kDeactivated, kProbation, kRejected, kTimeout, kGiveup, kInvariant
};

inline const char* termination_reason_to_string(TerminationReason r) {
    switch (r) {
        case TerminationReason::kDeactivated: return "deactivated";
        case TerminationReason::kProbation:   return "probation";
        case TerminationReason::kRejected:    return "rejected";
        case TerminationReason::kTimeout:     return "timeout";
        case TerminationReason::kGiveup:      return "giveup";
        case TerminationReason::kInvariant:   return "invariant";
        default:                              return "unknown";
    }
}

inline bool parse_termination_reason(const std::string& s, TerminationReason& out) {
    if (s == "deactivated") { out = TerminationReason::kDeactivated; return true; }
    if (s == "probation")   { out = TerminationReason::kProbation;   return true; }
    if (s == "rejected")    { out = TerminationReason::kRejected;    return true; }
    if (s == "timeout")     { out = TerminationReason::kTimeout;     return true; }
    if (s == "giveup")      { out = TerminationReason::kGiveup;      return true; }
    if (s == "invariant")   { out = TerminationReason::kInvariant;   return true; }
    return false;
}

struct SubscriptionState {
    enum class Kind { kInvalid, kActive, kPending, kTerminated };

    Kind kind = Kind::kInvalid;
    std::optional<uint32_t>          expires;      // active / pending
    std::optional<TerminationReason> reason;       // terminated
    std::optional<uint32_t>          retry_after;  // terminated

    static SubscriptionState active(std::optional<uint32_t> expires = std::nullopt) {
        SubscriptionState s;
        s.kind = Kind::kActive;
        s.expires = expires;
        return s;
    }
    static SubscriptionState pending(std::optional<uint32_t> expires = std::nullopt) {
        SubscriptionState s;
        s.kind = Kind::kPending;
        s.expires = expires;
        return s;
    }
    static SubscriptionState terminated(std::optional<TerminationReason> reason = std::nullopt,
                                        std::optional<uint32_t> retry_after = std::nullopt) {
        SubscriptionState s;
        s.kind = Kind::kTerminated;
        s.reason = reason;
        s.retry_after = retry_after;
        return s;
    }
    static SubscriptionState invalid() { return SubscriptionState(); }

    bool is_valid() const { return kind != Kind::kInvalid; }

    bool operator==(const SubscriptionState& o) const {
        return kind == o.kind && expires == o.expires &&
               reason == o.reason && retry_after == o.retry_after;
    }
    bool operator!=(const SubscriptionState& o) const { return !(*this == o); }
};

inline const char* state_kind_to_string(SubscriptionState::Kind k) {
    switch (k) {
        case SubscriptionState::Kind::kActive:     return "active";
        case SubscriptionState::Kind::kPending:    return "pending";
        case SubscriptionState::Kind::kTerminated: return "terminated";
        case SubscriptionState::Kind::kInvalid:    return "invalid";
        default:                                   return "unknown";
    }
}

// Classifies a Subscription-State header value. Never fails: anything
// malformed comes back as SubscriptionState::invalid(), so a bad NOTIFY from
// a peer cannot abort processing of the call it belongs to.
//
//   active|pending [;expires=N]
//   terminated [;reason=R] [;retry-after=N]
//
// N must be a non-negative integer; absent or -1 means no value. Values
// beyond 2^32-1 are clamped to it.
class SubscriptionStateParser {
public:
    static SubscriptionState parse(const HeaderTokens& tokens);
    static SubscriptionState parse(const SipMessage& message);
    static SubscriptionState parse(const std::string& header_value);

    // Canonical header text, e.g. "terminated;reason=probation;retry-after=30".
    static std::string render(const SubscriptionState& state);

private:
    // false on malformed input; `out` empty when absent or -1
    static bool parse_delta(const HeaderToken& token, const char* param,
                            std::optional<uint32_t>& out);
};

} // namespace sip_subscription
#endif
