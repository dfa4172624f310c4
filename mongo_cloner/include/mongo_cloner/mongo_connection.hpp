#pragma once

#include <string>

#include "mongo_cloner/connection.hpp"

namespace mongo_cloner
{
    // connect() pings the server before returning.
    class mongo_connection_provider : public connection_provider
    {
        private:
        std::string _appname;

        public:
        explicit mongo_connection_provider(std::string appname = "mongo_cloner");

        std::unique_ptr<database_handle> connect(const std::string& uri, const std::string& db_name) override;
    };
}
