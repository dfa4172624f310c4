#include "mongo_cloner/batch_writer.hpp"
#include "mongo_cloner/connection.hpp"
#include "mongo_cloner/errors.hpp"

#include <stdexcept>

namespace mongo_cloner
{

batch_writer::batch_writer(collection_handle& collection, std::string collection_name, std::size_t threshold, progress_sink sink):
      _collection(collection)
    , _collection_name(std::move(collection_name))
    , _threshold(threshold)
    , _sink(std::move(sink))
    , _total(0)
    , _flushes(0)
{
    if (_threshold == 0)
        throw std::invalid_argument("batch size must be at least 1");
}

void batch_writer::add(document doc)
{
    if (!doc.has_id())
        throw write_error("document without _id cannot be upserted into " + _collection_name);

    _pending.push_back(std::move(doc));

    if (_pending.size() >= _threshold)
        flush();
}

void batch_writer::flush()
{
    if (_pending.empty())
        return;

    _collection.bulk_upsert(_pending);

    _total += _pending.size();
    ++_flushes;
    _pending.clear();

    if (_sink)
        _sink("  " + _collection_name + ": " + std::to_string(_total) + " documents upserted...");
}

}
