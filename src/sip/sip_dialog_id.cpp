// =============================================================================
// FILE: src/sip/sip_dialog_id.cpp
// =============================================================================
#include "sip/sip_dialog_id.h"
#include "common/bson_tuple.h"
#include "common/logger.h"
#include <algorithm>
#include <cstring>

namespace sip_subscription {

DialogId DialogIdBuilder::build(const CallId& call_id, const std::string& local_tag,
                                const std::string& remote_tag) {
    return BsonTuple::digest({call_id, local_tag, remote_tag});
}

DialogId DialogIdBuilder::build_remote(const CallId& call_id, const std::string& local_tag,
                                       const std::string& remote_tag) {
    return build(call_id, remote_tag, local_tag);
}

DialogId DialogIdBuilder::build(const sip_t* sip, bool local_is_from) {
    if (!sip) {
        LOG_ERROR("DialogIdBuilder::build called with null sip");
        return "";
    }
    if (!sip->sip_call_id || !sip->sip_call_id->i_id) {
        LOG_ERROR("DialogIdBuilder::build: missing Call-ID");
        return "";
    }

    std::string call_id = sanitize(sip->sip_call_id->i_id);
    if (call_id.empty()) return "";

    std::string from_tag, to_tag;
    if (sip->sip_from && sip->sip_from->a_tag)
        from_tag = sanitize(sip->sip_from->a_tag);
    if (sip->sip_to && sip->sip_to->a_tag)
        to_tag = sanitize(sip->sip_to->a_tag);

    return local_is_from ? build(call_id, from_tag, to_tag)
                         : build(call_id, to_tag, from_tag);
}

bool DialogIdBuilder::is_valid(const std::string& dialog_id) {
    return !dialog_id.empty() && dialog_id.size() <= 1024;
}

std::string DialogIdBuilder::sanitize(const char* input, size_t max_len) {
    if (!input) return "";
    std::string result;
    result.reserve(std::min(strlen(input), max_len));
    for (size_t i = 0; input[i] != '\0' && i < max_len; ++i) {
        char c = input[i];
        if (c >= 0x20 && c <= 0x7E) result += c;
    }
    return result;
}

} // namespace sip_subscription
