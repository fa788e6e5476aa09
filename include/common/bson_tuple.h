// =============================================================================
// FILE: include/common/bson_tuple.h
// =============================================================================
#ifndef COMMON_BSON_TUPLE_H
#define COMMON_BSON_TUPLE_H

#include <optional>
#include <string>
#include <vector>

namespace sip_subscription {

// One tuple element. An absent element is written as BSON null.
using TupleField = std::optional<std::string>;

// Canonical binary form of a small string tuple: a BSON document whose
// elements are keyed "0".."n-1" in order, each a UTF-8 string or null.
// The same fields always produce the same bytes.
class BsonTuple {
public:
    // Empty string only if an element is too large for BSON.
    static std::string encode(const std::vector<TupleField>& fields);

    // False unless data is exactly one well-formed document of this shape.
    static bool decode(const std::string& data, std::vector<TupleField>& out);

    // MD5 of the canonical encoding, 32 lowercase hex digits.
    static std::string digest(const std::vector<TupleField>& fields);
};

} // namespace sip_subscription
#endif // COMMON_BSON_TUPLE_H
