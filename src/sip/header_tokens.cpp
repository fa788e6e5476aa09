// =============================================================================
// FILE: src/sip/header_tokens.cpp
// =============================================================================
#include "sip/header_tokens.h"
#include <algorithm>
#include <cctype>

namespace sip_subscription {

namespace {

std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Splits on `sep` outside double quotes.
std::vector<std::string> split_unquoted(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"' && (i == 0 || s[i - 1] != '\\')) quoted = !quoted;
        if (c == sep && !quoted) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

HeaderParam split_param(const std::string& raw) {
    auto eq = raw.find('=');
    if (eq == std::string::npos) {
        return {HeaderTokenizer::to_lower(trimmed(raw)), ""};
    }
    return {HeaderTokenizer::to_lower(trimmed(raw.substr(0, eq))), trimmed(raw.substr(eq + 1))};
}

} // namespace

const std::string* HeaderToken::find_param(const std::string& param) const {
    for (const auto& p : params) {
        if (p.first == param) return &p.second;
    }
    return nullptr;
}

std::string HeaderTokenizer::to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HeaderTokens HeaderTokenizer::tokenize(const std::string& value) {
    HeaderTokens tokens;
    for (const auto& element : split_unquoted(value, ',')) {
        if (trimmed(element).empty()) continue;

        auto parts = split_unquoted(element, ';');
        HeaderToken token;
        token.name = to_lower(trimmed(parts[0]));
        for (size_t i = 1; i < parts.size(); ++i) {
            if (trimmed(parts[i]).empty()) continue;
            token.params.push_back(split_param(parts[i]));
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

HeaderToken HeaderTokenizer::from_params(const char* name, const char* const* params) {
    HeaderToken token;
    token.name = to_lower(trimmed(name ? name : ""));
    for (size_t i = 0; params && params[i]; ++i) {
        token.params.push_back(split_param(params[i]));
    }
    return token;
}

std::string HeaderTokenizer::render(const HeaderToken& token) {
    std::string out = token.name;
    for (const auto& p : token.params) {
        out += ';';
        out += p.first;
        if (!p.second.empty()) {
            out += '=';
            out += p.second;
        }
    }
    return out;
}

} // namespace sip_subscription
