#pragma once

#include <stdexcept>
#include <string>

#include "mongo_cloner/replicator.hpp"

namespace mongo_cloner
{
    class usage_error : public std::runtime_error
    {
        public:
        explicit usage_error(const std::string& message);
    };

    struct command_line
    {
        // clone, dump or restore
        std::string _mode;

        std::string _src_uri;
        std::string _src_db;
        std::string _dst_uri;
        std::string _dst_db;

        // dump and restore
        std::string _uri;
        std::string _db;
        std::string _directory;

        replication_options _options;
        bool _help;

        command_line();
    };

    // Values from --config fill in what the command line leaves out. Throws usage_error.
    command_line parse_command_line(int argc, const char* const argv[]);

    std::string usage();
}
