// =============================================================================
// FILE: include/common/types.h
// =============================================================================
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <cstdint>
#include <chrono>
#include <string>

namespace sip_subscription {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millisecs = std::chrono::milliseconds;
using Seconds   = std::chrono::seconds;
using ServiceId = std::string;
using CallId    = std::string;
using DialogId  = std::string;
using SubscriptionId = std::string;

enum class Result {
    kOk, kError, kTimeout, kNotFound, kAlreadyExists,
    kCapacityExceeded, kInvalidArgument, kShuttingDown,
    kInvalidHandle, kInvalidSubscription, kInvalidField
};

inline const char* result_to_string(Result r) {
    switch (r) {
        case Result::kOk:                  return "OK";
        case Result::kError:               return "Error";
        case Result::kTimeout:             return "Timeout";
        case Result::kNotFound:            return "NotFound";
        case Result::kAlreadyExists:       return "AlreadyExists";
        case Result::kCapacityExceeded:    return "CapacityExceeded";
        case Result::kInvalidArgument:     return "InvalidArgument";
        case Result::kShuttingDown:        return "ShuttingDown";
        case Result::kInvalidHandle:       return "InvalidHandle";
        case Result::kInvalidSubscription: return "InvalidSubscription";
        case Result::kInvalidField:        return "InvalidField";
        default:                           return "Unknown";
    }
}

} // namespace sip_subscription
#endif // COMMON_TYPES_H
