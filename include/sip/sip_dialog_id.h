// =============================================================================
// FILE: include/sip/sip_dialog_id.h
// =============================================================================
#ifndef SIP_DIALOG_ID_H
#define SIP_DIALOG_ID_H
#include "common/types.h"
#include <sofia-sip/sip.h>
#include <string>

namespace sip_subscription {

// Dialog ids are local: each side hashes (Call-ID, own tag, peer tag), so the
// two ends of one dialog hold different ids. build_remote() gives the id the
// peer computes for the same dialog.
class DialogIdBuilder {
public:
    static DialogId build(const CallId& call_id, const std::string& local_tag,
                          const std::string& remote_tag);
    static DialogId build_remote(const CallId& call_id, const std::string& local_tag,
                                 const std::string& remote_tag);

    // local_is_from: we sent the request of this transaction (UAC side).
    static DialogId build(const sip_t* sip, bool local_is_from);

    static bool is_valid(const std::string& dialog_id);
    static std::string sanitize(const char* input, size_t max_len = 256);
};
} // namespace sip_subscription
#endif
