#pragma once

#include <string>

#include "mongo_cloner/value.hpp"

namespace mongo_cloner
{
namespace extended_json
{
    // One document as one line of canonical Extended JSON v2.
    std::string encode(const document& doc);

    // Accepts canonical, relaxed and legacy Extended JSON. Throws decode_error.
    document decode(const std::string& line);

    std::string oid_to_hex(const object_id& oid);
    bool oid_from_hex(const std::string& hex, object_id& oid);
}
}
