#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mongo_cloner/progress.hpp"
#include "mongo_cloner/value.hpp"

namespace mongo_cloner
{
    class collection_handle;

    // Nothing is flushed on destruction.
    class batch_writer
    {
        private:
        collection_handle& _collection;
        std::string _collection_name;
        std::size_t _threshold;
        progress_sink _sink;
        std::vector<document> _pending;
        std::size_t _total;
        std::size_t _flushes;

        public:
        batch_writer(collection_handle& collection, std::string collection_name, std::size_t threshold, progress_sink sink);

        batch_writer(const batch_writer&) = delete;
        batch_writer& operator=(const batch_writer&) = delete;

        // Throws write_error for a document without _id.
        void add(document doc);

        void flush();

        std::size_t total() const { return _total; }
        std::size_t pending() const { return _pending.size(); }
        std::size_t flushes() const { return _flushes; }
    };
}
