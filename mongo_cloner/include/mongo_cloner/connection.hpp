#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mongo_cloner/value.hpp"

namespace mongo_cloner
{
    // Forward-only stream over a collection.
    class document_cursor
    {
        public:
        virtual ~document_cursor() = default;

        // Fills `doc` and returns true, or returns false once exhausted.
        // Throws connection_error when the source fails mid-stream.
        virtual bool next(document& doc) = 0;
    };

    class collection_handle
    {
        public:
        virtual ~collection_handle() = default;

        virtual const std::string& name() const = 0;

        // Full, unfiltered scan.
        virtual std::unique_ptr<document_cursor> find_all() = 0;

        // Unordered replace-with-upsert by _id. Throws write_error if any failed.
        virtual void bulk_upsert(const std::vector<document>& docs) = 0;
    };

    class database_handle
    {
        public:
        virtual ~database_handle() = default;

        virtual const std::string& name() const = 0;

        // All collection names, system collections included.
        virtual std::vector<std::string> collection_names() = 0;

        virtual std::unique_ptr<collection_handle> collection(const std::string& name) = 0;
    };

    class connection_provider
    {
        public:
        virtual ~connection_provider() = default;

        virtual std::unique_ptr<database_handle> connect(const std::string& uri, const std::string& db_name) = 0;
    };
}
