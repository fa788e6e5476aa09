// =============================================================================
// FILE: include/dispatch/call.h
// =============================================================================
#ifndef DISPATCH_CALL_H
#define DISPATCH_CALL_H

#include "common/types.h"
#include "dialog/dialog.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace sip_subscription {

// All dialogs sharing one Call-ID within one service. Lives inside the
// CallWorker that owns it and is only touched on that worker's thread.
struct Call {
    ServiceId service_id;
    CallId    call_id;
    std::vector<Dialog> dialogs;

    Dialog* find_dialog(const DialogId& id) {
        auto it = std::find_if(dialogs.begin(), dialogs.end(),
                               [&id](const Dialog& d) { return d.id == id; });
        return it != dialogs.end() ? &*it : nullptr;
    }
    const Dialog* find_dialog(const DialogId& id) const {
        auto it = std::find_if(dialogs.begin(), dialogs.end(),
                               [&id](const Dialog& d) { return d.id == id; });
        return it != dialogs.end() ? &*it : nullptr;
    }

    // The dialog must belong to this call.
    Result add_dialog(Dialog dialog) {
        if (dialog.id.empty() || dialog.call_id != call_id || dialog.service_id != service_id) {
            return Result::kInvalidArgument;
        }
        if (find_dialog(dialog.id)) return Result::kAlreadyExists;
        dialogs.push_back(std::move(dialog));
        return Result::kOk;
    }

    Result remove_dialog(const DialogId& id) {
        auto it = std::find_if(dialogs.begin(), dialogs.end(),
                               [&id](const Dialog& d) { return d.id == id; });
        if (it == dialogs.end()) return Result::kNotFound;
        dialogs.erase(it);
        return Result::kOk;
    }
};

} // namespace sip_subscription
#endif // DISPATCH_CALL_H
