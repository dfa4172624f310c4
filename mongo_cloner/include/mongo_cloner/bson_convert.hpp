#pragma once

#include "mongo_cloner/value.hpp"

struct _bson_t;

namespace mongo_cloner
{
    // Throws decode_error on corrupt input or a kind the value model lacks.
    document from_bson(const _bson_t* bson);

    // Appends every field of `doc` to an initialized, empty `out`.
    void to_bson(const document& doc, _bson_t* out);
}
