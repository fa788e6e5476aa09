// =============================================================================
// FILE: include/subscription/remote_correlator.h
// =============================================================================
#ifndef SUBSCRIPTION_REMOTE_CORRELATOR_H
#define SUBSCRIPTION_REMOTE_CORRELATOR_H

#include "common/types.h"
#include <string>

namespace sip_subscription {

class CallDispatcher;

// Gives the handle the other end of the dialog uses for the same
// subscription. The subscription id is kept; service, dialog and call ids are
// translated through the dialog layer. The remote service defaults to the
// handle's own, which is the case when both ends run in this process.
class RemoteCorrelator {
public:
    explicit RemoteCorrelator(CallDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    Result remote_handle(const std::string& handle, std::string& out) const;
    Result remote_handle(const std::string& handle, const ServiceId& remote_service_id,
                         std::string& out) const;

private:
    CallDispatcher& dispatcher_;
};

} // namespace sip_subscription
#endif // SUBSCRIPTION_REMOTE_CORRELATOR_H
