// =============================================================================
// FILE: src/common/bson_tuple.cpp
// =============================================================================
#include "common/bson_tuple.h"
#include <bson/bson.h>
#include <sofia-sip/su_md5.h>
#include <climits>

namespace sip_subscription {

std::string BsonTuple::encode(const std::vector<TupleField>& fields) {
    bson_t doc;
    bson_init(&doc);

    bool ok = true;
    for (size_t i = 0; i < fields.size() && ok; ++i) {
        std::string key = std::to_string(i);
        const TupleField& field = fields[i];
        if (!field) {
            ok = bson_append_null(&doc, key.c_str(), -1);
        } else if (field->size() >= static_cast<size_t>(INT_MAX)) {
            ok = false;
        } else {
            ok = bson_append_utf8(&doc, key.c_str(), -1,
                                  field->data(), static_cast<int>(field->size()));
        }
    }

    std::string out;
    if (ok) out.assign(reinterpret_cast<const char*>(bson_get_data(&doc)), doc.len);
    bson_destroy(&doc);
    return out;
}

bool BsonTuple::decode(const std::string& data, std::vector<TupleField>& out) {
    bson_t doc;
    if (!bson_init_static(&doc, reinterpret_cast<const uint8_t*>(data.data()), data.size()))
        return false;

    size_t err_offset = 0;
    if (!bson_validate(&doc, BSON_VALIDATE_NONE, &err_offset)) return false;

    bson_iter_t iter;
    if (!bson_iter_init(&iter, &doc)) return false;

    std::vector<TupleField> fields;
    while (bson_iter_next(&iter)) {
        if (std::to_string(fields.size()) != bson_iter_key(&iter)) return false;

        if (BSON_ITER_HOLDS_UTF8(&iter)) {
            uint32_t len = 0;
            const char* value = bson_iter_utf8(&iter, &len);
            fields.emplace_back(std::string(value, len));
        } else if (BSON_ITER_HOLDS_NULL(&iter)) {
            fields.emplace_back(std::nullopt);
        } else {
            return false;
        }
    }

    out.swap(fields);
    return true;
}

std::string BsonTuple::digest(const std::vector<TupleField>& fields) {
    std::string encoded = encode(fields);

    su_md5_t md5;
    su_md5_init(&md5);
    su_md5_update(&md5, encoded.data(), encoded.size());
    char hex[2 * SU_MD5_DIGEST_SIZE + 1];
    su_md5_hexdigest(&md5, hex);
    su_md5_deinit(&md5);

    return std::string(hex, 2 * SU_MD5_DIGEST_SIZE);
}

} // namespace sip_subscription
