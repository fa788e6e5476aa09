// =============================================================================
// FILE: src/common/base64.cpp
// =============================================================================
#include "common/base64.h"
#include <sofia-sip/su_types.h>
#include <sofia-sip/base64.h>
#include <cctype>

namespace sip_subscription {

static bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

bool Base64::is_well_formed(const std::string& text) {
    size_t end = text.size();
    size_t padding = 0;
    while (end > 0 && text[end - 1] == '=' && padding < 2) {
        --end;
        ++padding;
    }
    for (size_t i = 0; i < end; ++i) {
        if (!is_base64_char(text[i])) return false;
    }
    if (end % 4 == 1) return false;
    if (padding > 0 && text.size() % 4 != 0) return false;
    return true;
}

std::string Base64::encode(const std::string& data) {
    std::string out(((data.size() + 2) / 3) * 4 + 1, '\0');
    size_t n = static_cast<size_t>(base64_e(&out[0], static_cast<isize_t>(out.size()),
                                            const_cast<char*>(data.data()),
                                            static_cast<isize_t>(data.size())));
    if (n >= out.size()) n = out.size() - 1;
    out.resize(n);
    return out;
}

bool Base64::decode(const std::string& text, std::string& out) {
    if (!is_well_formed(text)) return false;

    std::string buf((text.size() / 4 + 1) * 3, '\0');
    size_t n = static_cast<size_t>(base64_d(&buf[0], static_cast<isize_t>(buf.size()),
                                            text.c_str()));
    if (n > buf.size()) return false;
    buf.resize(n);
    out.swap(buf);
    return true;
}

} // namespace sip_subscription
