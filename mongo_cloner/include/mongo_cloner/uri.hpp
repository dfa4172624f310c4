#pragma once

#include <string>

namespace mongo_cloner
{
    // "10.0.0.15.:27017" becomes "10.0.0.15:27017".
    std::string normalize_uri(const std::string& uri);
}
