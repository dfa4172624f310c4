#pragma once

#include <stdexcept>
#include <string>

namespace mongo_cloner
{
    enum class error_kind
    {
        connection,
        path,
        decode,
        write,
    };

    const char* to_string(error_kind kind);

    class replication_error : public std::runtime_error
    {
        private:
        error_kind _kind;

        public:
        replication_error(error_kind kind, const std::string& message);

        error_kind kind() const { return _kind; }
    };

    // Source or destination cannot be resolved or stops answering.
    class connection_error : public replication_error
    {
        public:
        explicit connection_error(const std::string& message);
    };

    // Dump/restore directory or file problems.
    class path_error : public replication_error
    {
        public:
        explicit path_error(const std::string& message);
    };

    class decode_error : public replication_error
    {
        public:
        explicit decode_error(const std::string& message);
    };

    // A destination batch reported at least one failed operation.
    class write_error : public replication_error
    {
        public:
        explicit write_error(const std::string& message);
    };
}
