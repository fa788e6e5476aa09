// =============================================================================
// FILE: include/subscription/subscription_id.h
// =============================================================================
#ifndef SUBSCRIPTION_ID_H
#define SUBSCRIPTION_ID_H

#include "common/types.h"
#include "sip/header_tokens.h"
#include <cstdint>
#include <optional>

namespace sip_subscription {

struct SipMessage;

// Derives the identity of the subscription a message belongs to. The value
// is a digest, meaningful only within its dialog.
//
//   REFER request or response to one  -> H("refer", "<cseq>")
//   Event: pkg;id=X                   -> H(pkg, X)
//   Event: pkg                        -> H(pkg, null)
//   no Event header                   -> "id"
//
// A NOTIFY for a REFER carries "Event: refer;id=<cseq>" and so maps to the
// same subscription as the REFER that created it.
class SubscriptionIdDeriver {
public:
    static constexpr const char* kNoEventId = "id";

    static SubscriptionId derive(const SipMessage& message);

    static SubscriptionId for_refer(uint32_t cseq);
    static SubscriptionId for_event(const HeaderToken& event);
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_ID_H
