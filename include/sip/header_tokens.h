// =============================================================================
// FILE: include/sip/header_tokens.h
// =============================================================================
#ifndef SIP_HEADER_TOKENS_H
#define SIP_HEADER_TOKENS_H

#include <string>
#include <utility>
#include <vector>

namespace sip_subscription {

using HeaderParam = std::pair<std::string, std::string>;

// One `name;p1=v1;p2` element of a header value. Names are lower case,
// parameter values keep their original case; a flag parameter has an empty value.
struct HeaderToken {
    std::string name;
    std::vector<HeaderParam> params;

    // First value of `param`, nullptr when absent.
    const std::string* find_param(const std::string& param) const;

    bool operator==(const HeaderToken& o) const {
        return name == o.name && params == o.params;
    }
};

using HeaderTokens = std::vector<HeaderToken>;

class HeaderTokenizer {
public:
    // Splits on top level commas and semicolons; quoted strings are kept whole.
    static HeaderTokens tokenize(const std::string& value);

    // Builds one token from a sofia-style "name=value" parameter list.
    static HeaderToken from_params(const char* name, const char* const* params);

    // "name;p1=v1;flag"
    static std::string render(const HeaderToken& token);

    static std::string to_lower(std::string s);
};

} // namespace sip_subscription
#endif // SIP_HEADER_TOKENS_H
