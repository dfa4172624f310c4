#pragma once

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace mongo_cloner
{
    class database_handle;

    extern const char* const system_prefix;
    extern const char* const dump_suffix;

    struct dump_entry
    {
        std::string _collection;
        boost::filesystem::path _path;
    };

    bool is_system_collection(const std::string& name);

    // Collection names of a live database without system collections, sorted.
    std::vector<std::string> list_collections(database_handle& database);

    // '%', '/' and backslash in the collection name are written as %XX.
    std::string dump_file_name(const std::string& collection);

    // Regular files ending with the dump suffix, by collection name; system
    // collections left out.
    std::vector<dump_entry> list_dump_files(const boost::filesystem::path& directory);
}
