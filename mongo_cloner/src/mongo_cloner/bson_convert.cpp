#include "mongo_cloner/bson_convert.hpp"
#include "mongo_cloner/errors.hpp"
#include <bson/bson.h>

#include <cstring>
#include <memory>

namespace
{
using mongo_cloner::value;
using mongo_cloner::value_type;

value read_value(bson_iter_t* iter);

mongo_cloner::document read_document(bson_iter_t* iter)
{
    mongo_cloner::document doc;

    while (bson_iter_next(iter))
        doc.append(bson_iter_key(iter), read_value(iter));

    return doc;
}

value read_value(bson_iter_t* iter)
{
    switch (bson_iter_type(iter))
    {
        case BSON_TYPE_DOUBLE:
            return value(bson_iter_double(iter));
        case BSON_TYPE_UTF8:
        {
            uint32_t length = 0;
            const char* s = bson_iter_utf8(iter, &length);
            return value(std::string(s, length));
        }
        case BSON_TYPE_DOCUMENT:
        {
            bson_iter_t child;
            if (!bson_iter_recurse(iter, &child))
                throw mongo_cloner::decode_error(std::string("corrupt BSON sub-document in field ") + bson_iter_key(iter));
            return value(read_document(&child));
        }
        case BSON_TYPE_ARRAY:
        {
            bson_iter_t child;
            if (!bson_iter_recurse(iter, &child))
                throw mongo_cloner::decode_error(std::string("corrupt BSON array in field ") + bson_iter_key(iter));

            mongo_cloner::array items;
            while (bson_iter_next(&child))
                items.push_back(read_value(&child));
            return value(std::move(items));
        }
        case BSON_TYPE_BINARY:
        {
            bson_subtype_t subtype;
            uint32_t length = 0;
            const uint8_t* data = nullptr;
            bson_iter_binary(iter, &subtype, &length, &data);
            return value(mongo_cloner::binary_value{
                static_cast<std::uint8_t>(subtype), std::vector<std::uint8_t>(data, data + length)});
        }
        case BSON_TYPE_OID:
        {
            mongo_cloner::object_id oid;
            std::memcpy(oid.data(), bson_iter_oid(iter)->bytes, oid.size());
            return value(oid);
        }
        case BSON_TYPE_BOOL:
            return value(bson_iter_bool(iter));
        case BSON_TYPE_DATE_TIME:
            return value(mongo_cloner::date_time{bson_iter_date_time(iter)});
        case BSON_TYPE_NULL:
            return value();
        case BSON_TYPE_REGEX:
        {
            const char* options = nullptr;
            const char* pattern = bson_iter_regex(iter, &options);
            return value(mongo_cloner::regex_value{pattern, options ? options : ""});
        }
        case BSON_TYPE_CODE:
        {
            uint32_t length = 0;
            const char* code = bson_iter_code(iter, &length);
            return value(mongo_cloner::code_value{std::string(code, length)});
        }
        case BSON_TYPE_INT32:
            return value(static_cast<std::int32_t>(bson_iter_int32(iter)));
        case BSON_TYPE_TIMESTAMP:
        {
            uint32_t t = 0;
            uint32_t i = 0;
            bson_iter_timestamp(iter, &t, &i);
            return value(mongo_cloner::timestamp_value{t, i});
        }
        case BSON_TYPE_INT64:
            return value(static_cast<std::int64_t>(bson_iter_int64(iter)));
        case BSON_TYPE_DECIMAL128:
        {
            bson_decimal128_t dec;
            char text[BSON_DECIMAL128_STRING];
            if (!bson_iter_decimal128(iter, &dec))
                throw mongo_cloner::decode_error(std::string("corrupt decimal128 in field ") + bson_iter_key(iter));
            bson_decimal128_to_string(&dec, text);
            return value(mongo_cloner::decimal128_value{text});
        }
        case BSON_TYPE_MINKEY:
            return value(mongo_cloner::min_key());
        case BSON_TYPE_MAXKEY:
            return value(mongo_cloner::max_key());
        case BSON_TYPE_UNDEFINED:
            return value(mongo_cloner::undefined_value());
        case BSON_TYPE_SYMBOL:
        {
            uint32_t length = 0;
            const char* symbol = bson_iter_symbol(iter, &length);
            return value(mongo_cloner::symbol_value{std::string(symbol, length)});
        }
        case BSON_TYPE_DBPOINTER:
        {
            uint32_t length = 0;
            const char* collection = nullptr;
            const bson_oid_t* oid = nullptr;
            bson_iter_dbpointer(iter, &length, &collection, &oid);

            mongo_cloner::db_pointer_value pointer;
            pointer._collection.assign(collection, length);
            std::memcpy(pointer._oid.data(), oid->bytes, pointer._oid.size());
            return value(std::move(pointer));
        }
        case BSON_TYPE_CODEWSCOPE:
        {
            uint32_t length = 0;
            uint32_t scope_length = 0;
            const uint8_t* scope_data = nullptr;
            const char* code = bson_iter_codewscope(iter, &length, &scope_length, &scope_data);

            bson_t scope;
            if (!bson_init_static(&scope, scope_data, scope_length))
                throw mongo_cloner::decode_error(std::string("corrupt BSON scope in field ") + bson_iter_key(iter));

            bson_iter_t child;
            if (!bson_iter_init(&child, &scope))
                throw mongo_cloner::decode_error(std::string("corrupt BSON scope in field ") + bson_iter_key(iter));

            return value(mongo_cloner::code_with_scope_value{std::string(code, length), read_document(&child)});
        }
        default:
            break;
    }

    throw mongo_cloner::decode_error(
          std::string("unsupported BSON type ") + std::to_string(static_cast<int>(bson_iter_type(iter)))
        + " in field " + bson_iter_key(iter));
}

void append_value(bson_t* out, const char* key, int key_length, const value& v);

void append_document(bson_t* out, const mongo_cloner::document& doc)
{
    for (const auto& field : doc)
        append_value(out, field.first.data(), static_cast<int>(field.first.size()), field.second);
}

bool append_ok(bool appended, const char* key)
{
    if (!appended)
        throw mongo_cloner::write_error(std::string("document too large while appending field ") + key);
    return true;
}

void append_value(bson_t* out, const char* key, int key_length, const value& v)
{
    switch (v.type())
    {
        case value_type::null_type:
            append_ok(bson_append_null(out, key, key_length), key);
            break;
        case value_type::bool_type:
            append_ok(bson_append_bool(out, key, key_length, v.as_bool()), key);
            break;
        case value_type::int32_type:
            append_ok(bson_append_int32(out, key, key_length, v.as_int32()), key);
            break;
        case value_type::int64_type:
            append_ok(bson_append_int64(out, key, key_length, v.as_int64()), key);
            break;
        case value_type::double_type:
            append_ok(bson_append_double(out, key, key_length, v.as_double()), key);
            break;
        case value_type::decimal128_type:
        {
            bson_decimal128_t dec;
            if (!bson_decimal128_from_string(v.as_decimal128()._repr.c_str(), &dec))
                throw mongo_cloner::decode_error("invalid decimal128 '" + v.as_decimal128()._repr + "'");
            append_ok(bson_append_decimal128(out, key, key_length, &dec), key);
            break;
        }
        case value_type::string_type:
        {
            const std::string& s = v.as_string();
            append_ok(bson_append_utf8(out, key, key_length, s.data(), static_cast<int>(s.size())), key);
            break;
        }
        case value_type::array_type:
        {
            bson_t child;
            append_ok(bson_append_array_begin(out, key, key_length, &child), key);

            uint32_t index = 0;
            for (const auto& item : v.as_array())
            {
                char buffer[16];
                const char* index_key = nullptr;
                size_t index_length = bson_uint32_to_string(index++, &index_key, buffer, sizeof buffer);
                append_value(&child, index_key, static_cast<int>(index_length), item);
            }

            append_ok(bson_append_array_end(out, &child), key);
            break;
        }
        case value_type::document_type:
        {
            bson_t child;
            append_ok(bson_append_document_begin(out, key, key_length, &child), key);
            append_document(&child, v.as_document());
            append_ok(bson_append_document_end(out, &child), key);
            break;
        }
        case value_type::oid_type:
        {
            bson_oid_t oid;
            std::memcpy(oid.bytes, v.as_oid().data(), sizeof oid.bytes);
            append_ok(bson_append_oid(out, key, key_length, &oid), key);
            break;
        }
        case value_type::date_type:
            append_ok(bson_append_date_time(out, key, key_length, v.as_date()._millis), key);
            break;
        case value_type::timestamp_type:
        {
            mongo_cloner::timestamp_value ts = v.as_timestamp();
            append_ok(bson_append_timestamp(out, key, key_length, ts._t, ts._i), key);
            break;
        }
        case value_type::binary_type:
        {
            mongo_cloner::binary_value bin = v.as_binary();
            append_ok(bson_append_binary(out, key, key_length, static_cast<bson_subtype_t>(bin._subtype),
                bin._bytes.data(), static_cast<uint32_t>(bin._bytes.size())), key);
            break;
        }
        case value_type::regex_type:
        {
            mongo_cloner::regex_value re = v.as_regex();
            append_ok(bson_append_regex(out, key, key_length, re._pattern.c_str(), re._options.c_str()), key);
            break;
        }
        case value_type::code_type:
            append_ok(bson_append_code(out, key, key_length, v.as_code()._code.c_str()), key);
            break;
        case value_type::min_key_type:
            append_ok(bson_append_minkey(out, key, key_length), key);
            break;
        case value_type::max_key_type:
            append_ok(bson_append_maxkey(out, key, key_length), key);
            break;
        case value_type::undefined_type:
            append_ok(bson_append_undefined(out, key, key_length), key);
            break;
        case value_type::symbol_type:
        {
            const std::string symbol = v.as_symbol()._symbol;
            append_ok(bson_append_symbol(out, key, key_length, symbol.data(), static_cast<int>(symbol.size())), key);
            break;
        }
        case value_type::db_pointer_type:
        {
            mongo_cloner::db_pointer_value pointer = v.as_db_pointer();
            bson_oid_t oid;
            std::memcpy(oid.bytes, pointer._oid.data(), sizeof oid.bytes);
            append_ok(bson_append_dbpointer(out, key, key_length, pointer._collection.c_str(), &oid), key);
            break;
        }
        case value_type::code_with_scope_type:
        {
            mongo_cloner::code_with_scope_value code = v.as_code_with_scope();
            std::unique_ptr<bson_t, decltype(&bson_destroy)> scope(bson_new(), &bson_destroy);
            append_document(scope.get(), code._scope);
            append_ok(bson_append_code_with_scope(out, key, key_length, code._code.c_str(), scope.get()), key);
            break;
        }
    }
}
}

namespace mongo_cloner
{

document from_bson(const bson_t* bson)
{
    bson_iter_t iter;

    if (!bson_iter_init(&iter, bson))
        throw decode_error("corrupt BSON document");

    return read_document(&iter);
}

void to_bson(const document& doc, bson_t* out)
{
    append_document(out, doc);
}

}
