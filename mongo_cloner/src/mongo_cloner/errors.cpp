#include "mongo_cloner/errors.hpp"

namespace mongo_cloner
{

const char* to_string(error_kind kind)
{
    switch (kind)
    {
        case error_kind::connection: return "connection";
        case error_kind::path: return "path";
        case error_kind::decode: return "decode";
        case error_kind::write: return "write";
    }

    return "unknown";
}

replication_error::replication_error(error_kind kind, const std::string& message):
      std::runtime_error(message)
    , _kind(kind)
{
}

connection_error::connection_error(const std::string& message):
      replication_error(error_kind::connection, message)
{
}

path_error::path_error(const std::string& message):
      replication_error(error_kind::path, message)
{
}

decode_error::decode_error(const std::string& message):
      replication_error(error_kind::decode, message)
{
}

write_error::write_error(const std::string& message):
      replication_error(error_kind::write, message)
{
}

}
