#include "mongo_cloner/value.hpp"

#include <cmath>
#include <stdexcept>

namespace
{
[[noreturn]] void type_mismatch(mongo_cloner::value_type actual, mongo_cloner::value_type wanted)
{
    throw std::logic_error(
        std::string("value is ") + mongo_cloner::to_string(actual) + ", not " + mongo_cloner::to_string(wanted));
}

bool same_double(double a, double b)
{
    if (std::isnan(a) || std::isnan(b))
        return std::isnan(a) && std::isnan(b);

    // 0.0 and -0.0 are different values on the wire.
    return a == b && std::signbit(a) == std::signbit(b);
}
}

namespace mongo_cloner
{

const char* const id_field = "_id";

const char* to_string(value_type type)
{
    switch (type)
    {
        case value_type::null_type: return "null";
        case value_type::bool_type: return "bool";
        case value_type::int32_type: return "int32";
        case value_type::int64_type: return "int64";
        case value_type::double_type: return "double";
        case value_type::decimal128_type: return "decimal128";
        case value_type::string_type: return "string";
        case value_type::array_type: return "array";
        case value_type::document_type: return "document";
        case value_type::oid_type: return "objectId";
        case value_type::date_type: return "date";
        case value_type::timestamp_type: return "timestamp";
        case value_type::binary_type: return "binary";
        case value_type::regex_type: return "regex";
        case value_type::code_type: return "javascript";
        case value_type::min_key_type: return "minKey";
        case value_type::max_key_type: return "maxKey";
        case value_type::undefined_type: return "undefined";
        case value_type::symbol_type: return "symbol";
        case value_type::db_pointer_type: return "dbPointer";
        case value_type::code_with_scope_type: return "javascriptWithScope";
    }

    return "unknown";
}

value::value(value_type type):
      _type(type)
    , _bool(false)
    , _int(0)
    , _double(0.0)
    , _subtype(0)
    , _oid()
    , _timestamp{0, 0}
{
}

value::value(): value(value_type::null_type) {}

value::value(std::nullptr_t): value(value_type::null_type) {}

value::value(bool v): value(value_type::bool_type)
{
    _bool = v;
}

value::value(std::int32_t v): value(value_type::int32_type)
{
    _int = v;
}

value::value(std::int64_t v): value(value_type::int64_type)
{
    _int = v;
}

value::value(double v): value(value_type::double_type)
{
    _double = v;
}

value::value(const char* v): value(value_type::string_type)
{
    _string = v;
}

value::value(std::string v): value(value_type::string_type)
{
    _string = std::move(v);
}

value::value(array v): value(value_type::array_type)
{
    _array = std::make_shared<const array>(std::move(v));
}

value::value(document v): value(value_type::document_type)
{
    _document = std::make_shared<const document>(std::move(v));
}

value::value(const object_id& v): value(value_type::oid_type)
{
    _oid = v;
}

value::value(date_time v): value(value_type::date_type)
{
    _int = v._millis;
}

value::value(timestamp_value v): value(value_type::timestamp_type)
{
    _timestamp = v;
}

value::value(binary_value v): value(value_type::binary_type)
{
    _subtype = v._subtype;
    _bytes = std::move(v._bytes);
}

value::value(regex_value v): value(value_type::regex_type)
{
    _string = std::move(v._pattern);
    _options = std::move(v._options);
}

value::value(decimal128_value v): value(value_type::decimal128_type)
{
    _string = std::move(v._repr);
}

value::value(code_value v): value(value_type::code_type)
{
    _string = std::move(v._code);
}

value::value(min_key): value(value_type::min_key_type) {}

value::value(max_key): value(value_type::max_key_type) {}

value::value(undefined_value): value(value_type::undefined_type) {}

value::value(symbol_value v): value(value_type::symbol_type)
{
    _string = std::move(v._symbol);
}

value::value(db_pointer_value v): value(value_type::db_pointer_type)
{
    _string = std::move(v._collection);
    _oid = v._oid;
}

value::value(code_with_scope_value v): value(value_type::code_with_scope_type)
{
    _string = std::move(v._code);
    _document = std::make_shared<const document>(std::move(v._scope));
}

bool value::as_bool() const
{
    if (_type != value_type::bool_type)
        type_mismatch(_type, value_type::bool_type);
    return _bool;
}

std::int32_t value::as_int32() const
{
    if (_type != value_type::int32_type)
        type_mismatch(_type, value_type::int32_type);
    return static_cast<std::int32_t>(_int);
}

std::int64_t value::as_int64() const
{
    if (_type != value_type::int64_type)
        type_mismatch(_type, value_type::int64_type);
    return _int;
}

double value::as_double() const
{
    if (_type != value_type::double_type)
        type_mismatch(_type, value_type::double_type);
    return _double;
}

const std::string& value::as_string() const
{
    if (_type != value_type::string_type)
        type_mismatch(_type, value_type::string_type);
    return _string;
}

const array& value::as_array() const
{
    if (_type != value_type::array_type)
        type_mismatch(_type, value_type::array_type);
    return *_array;
}

const document& value::as_document() const
{
    if (_type != value_type::document_type)
        type_mismatch(_type, value_type::document_type);
    return *_document;
}

const object_id& value::as_oid() const
{
    if (_type != value_type::oid_type)
        type_mismatch(_type, value_type::oid_type);
    return _oid;
}

date_time value::as_date() const
{
    if (_type != value_type::date_type)
        type_mismatch(_type, value_type::date_type);
    return date_time{_int};
}

timestamp_value value::as_timestamp() const
{
    if (_type != value_type::timestamp_type)
        type_mismatch(_type, value_type::timestamp_type);
    return _timestamp;
}

binary_value value::as_binary() const
{
    if (_type != value_type::binary_type)
        type_mismatch(_type, value_type::binary_type);
    return binary_value{_subtype, _bytes};
}

regex_value value::as_regex() const
{
    if (_type != value_type::regex_type)
        type_mismatch(_type, value_type::regex_type);
    return regex_value{_string, _options};
}

decimal128_value value::as_decimal128() const
{
    if (_type != value_type::decimal128_type)
        type_mismatch(_type, value_type::decimal128_type);
    return decimal128_value{_string};
}

code_value value::as_code() const
{
    if (_type != value_type::code_type)
        type_mismatch(_type, value_type::code_type);
    return code_value{_string};
}

symbol_value value::as_symbol() const
{
    if (_type != value_type::symbol_type)
        type_mismatch(_type, value_type::symbol_type);
    return symbol_value{_string};
}

db_pointer_value value::as_db_pointer() const
{
    if (_type != value_type::db_pointer_type)
        type_mismatch(_type, value_type::db_pointer_type);
    return db_pointer_value{_string, _oid};
}

code_with_scope_value value::as_code_with_scope() const
{
    if (_type != value_type::code_with_scope_type)
        type_mismatch(_type, value_type::code_with_scope_type);
    return code_with_scope_value{_string, *_document};
}

bool value::operator==(const value& other) const
{
    if (_type != other._type)
        return false;

    switch (_type)
    {
        case value_type::null_type:
        case value_type::min_key_type:
        case value_type::max_key_type:
        case value_type::undefined_type:
            return true;
        case value_type::bool_type:
            return _bool == other._bool;
        case value_type::int32_type:
        case value_type::int64_type:
        case value_type::date_type:
            return _int == other._int;
        case value_type::double_type:
            return same_double(_double, other._double);
        case value_type::decimal128_type:
        case value_type::string_type:
        case value_type::code_type:
        case value_type::symbol_type:
            return _string == other._string;
        case value_type::db_pointer_type:
            return _string == other._string && _oid == other._oid;
        case value_type::code_with_scope_type:
            return _string == other._string && *_document == *other._document;
        case value_type::array_type:
            return *_array == *other._array;
        case value_type::document_type:
            return *_document == *other._document;
        case value_type::oid_type:
            return _oid == other._oid;
        case value_type::timestamp_type:
            return _timestamp._t == other._timestamp._t && _timestamp._i == other._timestamp._i;
        case value_type::binary_type:
            return _subtype == other._subtype && _bytes == other._bytes;
        case value_type::regex_type:
            return _string == other._string && _options == other._options;
    }

    return false;
}

document::document(std::initializer_list<field> fields): _fields(fields)
{
}

document& document::append(std::string name, value v)
{
    _fields.emplace_back(std::move(name), std::move(v));
    return *this;
}

const value* document::find(const std::string& name) const
{
    for (const auto& f : _fields)
    {
        if (f.first == name)
            return &f.second;
    }

    return nullptr;
}

bool document::has_id() const
{
    return find(id_field) != nullptr;
}

const value& document::id() const
{
    const value* v = find(id_field);

    if (!v)
        throw std::out_of_range("document has no _id field");

    return *v;
}

}
