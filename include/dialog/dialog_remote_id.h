// =============================================================================
// FILE: include/dialog/dialog_remote_id.h
// =============================================================================
#ifndef DIALOG_REMOTE_ID_H
#define DIALOG_REMOTE_ID_H

#include "common/types.h"
#include <string>

namespace sip_subscription {

class CallDispatcher;

// Maps a local dialog handle to the handle the peer holds for the same
// dialog: the peer's service id and the dialog id with the tags swapped.
// Reads the live dialog through the dispatcher.
//
//   kInvalidHandle  input is not a dialog handle
//   kNotFound       call or dialog no longer exists
class DialogRemoteId {
public:
    static Result resolve(CallDispatcher& dispatcher, const std::string& dialog_handle,
                          const ServiceId& remote_service_id, std::string& out);
};

} // namespace sip_subscription
#endif // DIALOG_REMOTE_ID_H
