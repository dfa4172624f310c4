#include "mongo_cloner/collection_enumerator.hpp"
#include "mongo_cloner/connection.hpp"

#include <algorithm>
#include <cstring>

#include <boost/filesystem/operations.hpp>

namespace
{
bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Collection names may hold '/', which no file name can.
std::string escape_file_name(const std::string& collection)
{
    std::string out;

    for (char c : collection)
    {
        switch (c)
        {
            case '%': out += "%25"; break;
            case '/': out += "%2F"; break;
            case '\\': out += "%5C"; break;
            default: out += c; break;
        }
    }

    return out;
}

std::string unescape_file_name(const std::string& name)
{
    std::string out;

    for (std::string::size_type i = 0; i < name.size(); ++i)
    {
        if (name[i] == '%' && i + 2 < name.size() && hex_digit(name[i + 1]) >= 0 && hex_digit(name[i + 2]) >= 0)
        {
            out += static_cast<char>(hex_digit(name[i + 1]) * 16 + hex_digit(name[i + 2]));
            i += 2;
            continue;
        }

        out += name[i];
    }

    return out;
}
}

namespace mongo_cloner
{

const char* const system_prefix = "system.";
const char* const dump_suffix = ".json";

bool is_system_collection(const std::string& name)
{
    return name.compare(0, std::strlen(system_prefix), system_prefix) == 0;
}

std::vector<std::string> list_collections(database_handle& database)
{
    std::vector<std::string> names;

    for (auto& name : database.collection_names())
    {
        if (!is_system_collection(name))
            names.push_back(std::move(name));
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::string dump_file_name(const std::string& collection)
{
    return escape_file_name(collection) + dump_suffix;
}

std::vector<dump_entry> list_dump_files(const boost::filesystem::path& directory)
{
    const std::string suffix(dump_suffix);
    std::vector<dump_entry> entries;

    boost::filesystem::directory_iterator end;

    for (boost::filesystem::directory_iterator it(directory); it != end; ++it)
    {
        if (!boost::filesystem::is_regular_file(it->status()))
            continue;

        std::string file_name = it->path().filename().string();

        if (file_name.size() <= suffix.size() || !ends_with(file_name, suffix))
            continue;

        std::string collection = unescape_file_name(file_name.substr(0, file_name.size() - suffix.size()));

        if (is_system_collection(collection))
            continue;

        entries.push_back(dump_entry{collection, it->path()});
    }

    std::sort(entries.begin(), entries.end(),
        [](const dump_entry& a, const dump_entry& b) { return a._collection < b._collection; });

    return entries;
}

}
