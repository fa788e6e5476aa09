// =============================================================================
// FILE: src/sip/sip_message.cpp
// =============================================================================
#include "sip/sip_message.h"
#include "sip/sip_dialog_id.h"
#include "common/logger.h"
#include <sofia-sip/msg.h>
#include <sofia-sip/sip_parser.h>
#include <cstring>

namespace sip_subscription {

static std::string safe_copy_n(const char* str, size_t max) {
    if (!str) return "";
    return std::string(str, strnlen(str, max));
}

bool SipMessage::is_refer_transaction() const {
    if (cseq_method != "REFER") return false;
    return !is_request() || method == "REFER";
}

std::unique_ptr<SipMessage> SipMessage::create_from_sofia(
    const ServiceId& service_id, SipDirection direction, const sip_t* sip)
{
    if (!sip) {
        LOG_ERROR("SipMessage::create_from_sofia called with null sip");
        return nullptr;
    }
    if (!sip->sip_call_id || !sip->sip_call_id->i_id || !sip->sip_cseq) {
        LOG_WARN("SipMessage: missing Call-ID or CSeq, ignoring message");
        return nullptr;
    }

    auto msg = std::make_unique<SipMessage>();
    msg->service_id = service_id;
    msg->direction  = direction;

    if (sip->sip_request) {
        msg->msg_class = SipMessageClass::kRequest;
        msg->method    = safe_copy_n(sip->sip_request->rq_method_name, 32);
    } else if (sip->sip_status) {
        msg->msg_class = SipMessageClass::kResponse;
        msg->status    = sip->sip_status->st_status;
    } else {
        LOG_WARN("SipMessage: neither request nor status line, ignoring message");
        return nullptr;
    }

    msg->call_id     = DialogIdBuilder::sanitize(sip->sip_call_id->i_id);
    msg->cseq        = sip->sip_cseq->cs_seq;
    msg->cseq_method = safe_copy_n(sip->sip_cseq->cs_method_name, 32);

    if (sip->sip_from) msg->from_tag = DialogIdBuilder::sanitize(sip->sip_from->a_tag);
    if (sip->sip_to)   msg->to_tag   = DialogIdBuilder::sanitize(sip->sip_to->a_tag);

    msg->dialog_id = DialogIdBuilder::build(sip, msg->is_uac());
    if (!DialogIdBuilder::is_valid(msg->dialog_id)) {
        LOG_WARN("SipMessage: unusable Call-ID, ignoring message");
        return nullptr;
    }

    if (sip->sip_event && sip->sip_event->o_type) {
        msg->event = HeaderTokenizer::from_params(sip->sip_event->o_type,
                                                  sip->sip_event->o_params);
    }

    if (sip->sip_subscription_state && sip->sip_subscription_state->ss_substate) {
        msg->subscription_state.push_back(HeaderTokenizer::from_params(
            sip->sip_subscription_state->ss_substate,
            sip->sip_subscription_state->ss_params));
    }

    LOG_TRACE("SipMessage: %s %s cseq=%u %s call=%s dialog=%s",
              message_class_to_string(msg->msg_class),
              msg->is_request() ? msg->method.c_str() : std::to_string(msg->status).c_str(),
              msg->cseq, msg->cseq_method.c_str(),
              msg->call_id.c_str(), msg->dialog_id.c_str());

    return msg;
}

std::unique_ptr<SipMessage> SipMessage::parse(
    const ServiceId& service_id, SipDirection direction, const std::string& text)
{
    std::string wire;
    wire.reserve(text.size() + 32);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) wire += '\r';
        wire += text[i];
    }
    // Header block must be terminated by an empty line.
    if (wire.find("\r\n\r\n") == std::string::npos) {
        while (wire.size() >= 2 && wire.compare(wire.size() - 2, 2, "\r\n") == 0) wire.resize(wire.size() - 2);
        wire += "\r\n\r\n";
    }

    std::unique_ptr<msg_t, void (*)(msg_t*)> raw(
        msg_make(sip_default_mclass(), 0, wire.data(), static_cast<ssize_t>(wire.size())),
        msg_destroy);
    if (!raw) {
        LOG_WARN("SipMessage: sofia parser rejected %zu bytes", wire.size());
        return nullptr;
    }

    const sip_t* sip = sip_object(raw.get());
    if (!sip || (!sip->sip_request && !sip->sip_status)) {
        LOG_WARN("SipMessage: no request or status line in %zu bytes", wire.size());
        return nullptr;
    }
    return create_from_sofia(service_id, direction, sip);
}

} // namespace sip_subscription
