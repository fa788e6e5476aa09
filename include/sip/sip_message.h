// =============================================================================
// FILE: include/sip/sip_message.h
// =============================================================================
#ifndef SIP_MESSAGE_H
#define SIP_MESSAGE_H

#include "common/types.h"
#include "sip/header_tokens.h"
#include <sofia-sip/sip.h>
#include <memory>
#include <optional>
#include <string>

namespace sip_subscription {

enum class SipDirection { kIncoming, kOutgoing };

enum class SipMessageClass { kRequest, kResponse };

inline const char* message_class_to_string(SipMessageClass c) {
    switch (c) {
        case SipMessageClass::kRequest:  return "request";
        case SipMessageClass::kResponse: return "response";
        default:                         return "invalid";
    }
}

// The parts of a SIP request or response the subscription layer reads.
// Extracted once from the parser's structure; plain value afterwards.
struct SipMessage {
    ServiceId       service_id;
    DialogId        dialog_id;
    CallId          call_id;

    SipMessageClass msg_class  = SipMessageClass::kRequest;
    SipDirection    direction  = SipDirection::kIncoming;
    std::string     method;         // request method, empty for responses
    int             status     = 0; // response status, 0 for requests
    uint32_t        cseq       = 0;
    std::string     cseq_method;
    std::string     from_tag;
    std::string     to_tag;

    std::optional<HeaderToken> event;   // Event header
    HeaderTokens    subscription_state; // Subscription-State header tokens

    bool is_request() const { return msg_class == SipMessageClass::kRequest; }

    // A REFER request, or any response to one.
    bool is_refer_transaction() const;

    // We sent the request of this transaction.
    bool is_uac() const {
        return is_request() == (direction == SipDirection::kOutgoing);
    }
    const std::string& local_tag() const  { return is_uac() ? from_tag : to_tag; }
    const std::string& remote_tag() const { return is_uac() ? to_tag : from_tag; }

    // nullptr when the message has no usable Call-ID or no CSeq.
    static std::unique_ptr<SipMessage> create_from_sofia(
        const ServiceId& service_id, SipDirection direction, const sip_t* sip);

    // Parses raw message text with the sofia-sip parser. Bare LF line ends
    // are accepted. nullptr when the text is not a usable SIP message.
    static std::unique_ptr<SipMessage> parse(
        const ServiceId& service_id, SipDirection direction, const std::string& text);
};

} // namespace sip_subscription
#endif
