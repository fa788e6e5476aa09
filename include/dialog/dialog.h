// =============================================================================
// FILE: include/dialog/dialog.h
// =============================================================================
#ifndef DIALOG_DIALOG_H
#define DIALOG_DIALOG_H

#include "common/types.h"
#include "subscription/subscription.h"
#include <cstdint>
#include <string>
#include <vector>

namespace sip_subscription {

struct Dialog {
    DialogId    id;
    ServiceId   service_id;
    CallId      call_id;

    std::string local_tag;
    std::string remote_tag;
    std::string local_uri;
    std::string remote_uri;
    std::string local_target;
    std::string remote_target;
    uint32_t    local_seq  = 0;
    uint32_t    remote_seq = 0;
    int64_t     created = 0;   // unix seconds
    int64_t     updated = 0;

    // Insertion order; at most one entry per subscription id.
    std::vector<Subscription> subscriptions;
};

} // namespace sip_subscription
#endif // DIALOG_DIALOG_H
