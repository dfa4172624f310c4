#include "mongo_cloner/extended_json.hpp"
#include "mongo_cloner/bson_convert.hpp"
#include "mongo_cloner/errors.hpp"
#include <bson/bson.h>

#include <cstring>
#include <memory>

namespace
{
typedef std::unique_ptr<bson_t, decltype(&bson_destroy)> bson_ptr;
typedef std::unique_ptr<char, decltype(&bson_free)> json_text;

const char decimal_tag[] = "\"$numberDecimal\"";

bool starts_with_object(const std::string& line)
{
    std::string::size_type first = line.find_first_not_of(" \t\r\n");
    return first != std::string::npos && line[first] == '{';
}

// libbson turns an unparsable $numberDecimal into NaN instead of failing.
void check_decimals(const std::string& line)
{
    const std::string::size_type tag_length = sizeof decimal_tag - 1;

    for (std::string::size_type at = line.find(decimal_tag); at != std::string::npos; at = line.find(decimal_tag, at + tag_length))
    {
        std::string::size_type pos = line.find_first_not_of(" \t", at + tag_length);

        if (pos == std::string::npos || line[pos] != ':')
            continue;

        pos = line.find_first_not_of(" \t", pos + 1);

        if (pos == std::string::npos || line[pos] != '"')
            continue;

        std::string::size_type end = line.find('"', pos + 1);

        if (end == std::string::npos)
            continue;

        const std::string text = line.substr(pos + 1, end - pos - 1);
        bson_decimal128_t dec;

        if (!bson_decimal128_from_string(text.c_str(), &dec))
            throw mongo_cloner::decode_error("invalid $numberDecimal \"" + text + "\"");
    }
}
}

namespace mongo_cloner
{
namespace extended_json
{

std::string encode(const document& doc)
{
    bson_ptr bson(bson_new(), &bson_destroy);
    to_bson(doc, bson.get());

    size_t length = 0;
    json_text json(bson_as_canonical_extended_json(bson.get(), &length), &bson_free);

    if (!json)
        throw write_error("document cannot be rendered as Extended JSON");

    return std::string(json.get(), length);
}

document decode(const std::string& line)
{
    if (!starts_with_object(line))
        throw decode_error("expected a JSON object");

    bson_error_t error;
    bson_ptr bson(
          bson_new_from_json(reinterpret_cast<const uint8_t*>(line.data()), static_cast<ssize_t>(line.size()), &error)
        , &bson_destroy);

    if (!bson)
        throw decode_error(std::string("invalid Extended JSON: ") + error.message);

    check_decimals(line);

    return from_bson(bson.get());
}

std::string oid_to_hex(const object_id& oid)
{
    bson_oid_t raw;
    char text[25];

    std::memcpy(raw.bytes, oid.data(), oid.size());
    bson_oid_to_string(&raw, text);

    return text;
}

bool oid_from_hex(const std::string& hex, object_id& oid)
{
    if (!bson_oid_is_valid(hex.c_str(), hex.size()))
        return false;

    bson_oid_t raw;
    bson_oid_init_from_string(&raw, hex.c_str());
    std::memcpy(oid.data(), raw.bytes, oid.size());

    return true;
}

}
}
