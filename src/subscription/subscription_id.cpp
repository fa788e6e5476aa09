// =============================================================================
// FILE: src/subscription/subscription_id.cpp
// =============================================================================
#include "subscription/subscription_id.h"
#include "common/bson_tuple.h"
#include "sip/sip_message.h"
#include <string>

namespace sip_subscription {

SubscriptionId SubscriptionIdDeriver::for_refer(uint32_t cseq) {
    return BsonTuple::digest({std::string("refer"), std::to_string(cseq)});
}

SubscriptionId SubscriptionIdDeriver::for_event(const HeaderToken& event) {
    TupleField id;
    if (const std::string* value = event.find_param("id")) id = *value;
    return BsonTuple::digest({event.name, id});
}

SubscriptionId SubscriptionIdDeriver::derive(const SipMessage& message) {
    if (message.is_refer_transaction()) return for_refer(message.cseq);
    if (message.event) return for_event(*message.event);
    return kNoEventId;
}

} // namespace sip_subscription
