#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mongo_cloner
{
    enum class value_type
    {
        null_type,
        bool_type,
        int32_type,
        int64_type,
        double_type,
        decimal128_type,
        string_type,
        array_type,
        document_type,
        oid_type,
        date_type,
        timestamp_type,
        binary_type,
        regex_type,
        code_type,
        min_key_type,
        max_key_type,
        undefined_type,
        symbol_type,
        db_pointer_type,
        code_with_scope_type,
    };

    const char* to_string(value_type type);

    typedef std::array<std::uint8_t, 12> object_id;

    // Milliseconds since the Unix epoch, UTC.
    struct date_time
    {
        std::int64_t _millis;
    };

    // Internal replication timestamp: seconds plus ordinal.
    struct timestamp_value
    {
        std::uint32_t _t;
        std::uint32_t _i;
    };

    struct binary_value
    {
        std::uint8_t _subtype;
        std::vector<std::uint8_t> _bytes;
    };

    struct regex_value
    {
        std::string _pattern;
        std::string _options;
    };

    // Kept in its canonical string form; the BSON adapter does the bit packing.
    struct decimal128_value
    {
        std::string _repr;
    };

    struct code_value
    {
        std::string _code;
    };

    struct min_key {};
    struct max_key {};

    // Deprecated kinds, copied as is.
    struct undefined_value {};

    struct symbol_value
    {
        std::string _symbol;
    };

    struct db_pointer_value
    {
        std::string _collection;
        object_id _oid;
    };

    class value;
    class document;
    struct code_with_scope_value;

    typedef std::vector<value> array;

    // One field value of a document. The set of kinds is closed.
    class value
    {
        private:
        value_type _type;
        bool _bool;
        std::int64_t _int;
        double _double;
        std::string _string;
        std::string _options;
        std::uint8_t _subtype;
        std::vector<std::uint8_t> _bytes;
        object_id _oid;
        timestamp_value _timestamp;
        std::shared_ptr<const array> _array;
        std::shared_ptr<const document> _document;

        explicit value(value_type type);

        public:
        value();
        value(std::nullptr_t);
        value(bool v);
        value(std::int32_t v);
        value(std::int64_t v);
        value(double v);
        value(const char* v);
        value(std::string v);
        value(array v);
        value(document v);
        value(const object_id& v);
        value(date_time v);
        value(timestamp_value v);
        value(binary_value v);
        value(regex_value v);
        value(decimal128_value v);
        value(code_value v);
        value(min_key);
        value(max_key);
        value(undefined_value);
        value(symbol_value v);
        value(db_pointer_value v);
        value(code_with_scope_value v);

        value_type type() const { return _type; }
        bool is_null() const { return _type == value_type::null_type; }

        bool as_bool() const;
        std::int32_t as_int32() const;
        std::int64_t as_int64() const;
        double as_double() const;
        const std::string& as_string() const;
        const array& as_array() const;
        const document& as_document() const;
        const object_id& as_oid() const;
        date_time as_date() const;
        timestamp_value as_timestamp() const;
        binary_value as_binary() const;
        regex_value as_regex() const;
        decimal128_value as_decimal128() const;
        code_value as_code() const;
        symbol_value as_symbol() const;
        db_pointer_value as_db_pointer() const;
        code_with_scope_value as_code_with_scope() const;

        bool operator==(const value& other) const;
        bool operator!=(const value& other) const { return !(*this == other); }
    };

    // Ordered field list; order survives clone, dump and restore.
    class document
    {
        public:
        typedef std::pair<std::string, value> field;
        typedef std::vector<field>::const_iterator const_iterator;

        private:
        std::vector<field> _fields;

        public:
        document() = default;
        document(std::initializer_list<field> fields);

        document& append(std::string name, value v);

        // First field with this name or nullptr.
        const value* find(const std::string& name) const;

        bool has_id() const;
        const value& id() const;

        std::size_t size() const { return _fields.size(); }
        bool empty() const { return _fields.empty(); }
        void clear() { _fields.clear(); }

        const_iterator begin() const { return _fields.begin(); }
        const_iterator end() const { return _fields.end(); }

        bool operator==(const document& other) const { return _fields == other._fields; }
        bool operator!=(const document& other) const { return !(*this == other); }
    };

    struct code_with_scope_value
    {
        std::string _code;
        document _scope;
    };

    extern const char* const id_field;
}
