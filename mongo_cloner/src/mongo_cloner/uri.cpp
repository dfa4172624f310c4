#include "mongo_cloner/uri.hpp"

namespace mongo_cloner
{

std::string normalize_uri(const std::string& uri)
{
    std::string out;
    out.reserve(uri.size());

    for (std::size_t i = 0; i < uri.size(); ++i)
    {
        bool before_port = uri[i] == '.'
            && i + 2 < uri.size()
            && uri[i + 1] == ':'
            && uri[i + 2] >= '0' && uri[i + 2] <= '9';

        if (!before_port)
            out += uri[i];
    }

    return out;
}

}
