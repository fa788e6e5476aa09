// =============================================================================
// FILE: include/common/base64.h
// =============================================================================
#ifndef COMMON_BASE64_H
#define COMMON_BASE64_H

#include <string>

namespace sip_subscription {

// Standard-alphabet base64 on top of the sofia-sip codec.
class Base64 {
public:
    static std::string encode(const std::string& data);

    // Rejects anything outside [A-Za-z0-9+/] with at most two trailing '='.
    static bool decode(const std::string& text, std::string& out);

    static bool is_well_formed(const std::string& text);
};

} // namespace sip_subscription
#endif // COMMON_BASE64_H
