#include "mongo_cloner/replicator.hpp"
#include "mongo_cloner/batch_writer.hpp"
#include "mongo_cloner/collection_enumerator.hpp"
#include "mongo_cloner/connection.hpp"
#include "mongo_cloner/errors.hpp"
#include "mongo_cloner/extended_json.hpp"
#include "mongo_cloner/uri.hpp"

#include <exception>
#include <fstream>
#include <stdexcept>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

namespace
{
namespace fs = boost::filesystem;

using mongo_cloner::operation_result;
using mongo_cloner::progress_sink;

// Records every line in the result and forwards it to the caller's sink.
progress_sink make_log(operation_result& result, const progress_sink& sink)
{
    return [&result, &sink](const std::string& line)
    {
        result._log.push_back(line);

        if (sink)
            sink(line);
    };
}

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}

// With isolation an error is logged against the collection and the run moves on.
template <typename Work>
void run_collection(
      const std::string& name
    , bool isolate
    , const progress_sink& log
    , operation_result& result
    , Work work)
{
    if (!isolate)
    {
        result._documents += work();
        ++result._collections;
        return;
    }

    try
    {
        result._documents += work();
        ++result._collections;
    }
    catch (const mongo_cloner::connection_error&)
    {
        // The source or destination is gone; later collections would fail the same way.
        throw;
    }
    catch (const std::exception& e)
    {
        log("ERROR: " + name + ": " + e.what());
        ++result._failed_collections;
    }
}

// The single error boundary of an operation.
template <typename Body>
operation_result run_operation(const std::string& title, const progress_sink& sink, Body body)
{
    operation_result result;
    progress_sink log = make_log(result, sink);

    try
    {
        body(log, result);
    }
    catch (const std::exception& e)
    {
        log(std::string("ERROR: ") + e.what());
        result._status = 1;
        return result;
    }
    catch (...)
    {
        log("ERROR: unknown error");
        result._status = 1;
        return result;
    }

    if (result._failed_collections > 0)
    {
        log(title + " finished with " + std::to_string(result._failed_collections) + " failed collection(s).");
        result._status = 1;
        return result;
    }

    log(title + " completed successfully.");
    return result;
}

std::size_t clone_collection(
      mongo_cloner::database_handle& source
    , mongo_cloner::database_handle& destination
    , const std::string& name
    , std::size_t batch_size
    , const progress_sink& log)
{
    log("Cloning collection: " + name);

    std::unique_ptr<mongo_cloner::collection_handle> from = source.collection(name);
    std::unique_ptr<mongo_cloner::collection_handle> to = destination.collection(name);

    mongo_cloner::batch_writer writer(*to, name, batch_size, log);
    std::unique_ptr<mongo_cloner::document_cursor> cursor = from->find_all();
    mongo_cloner::document doc;

    while (cursor->next(doc))
        writer.add(std::move(doc));

    writer.flush();

    log("  Finished " + name + " with " + std::to_string(writer.total()) + " documents.");
    return writer.total();
}

std::size_t dump_collection(
      mongo_cloner::database_handle& source
    , const std::string& name
    , const fs::path& directory
    , const progress_sink& log)
{
    log("Exporting collection: " + name);

    const fs::path file = directory / mongo_cloner::dump_file_name(name);
    std::ofstream out(file.string(), std::ios::out | std::ios::trunc | std::ios::binary);

    if (!out)
        throw mongo_cloner::path_error("cannot open " + file.string() + " for writing");

    std::unique_ptr<mongo_cloner::collection_handle> from = source.collection(name);
    std::unique_ptr<mongo_cloner::document_cursor> cursor = from->find_all();
    mongo_cloner::document doc;
    std::size_t count = 0;

    while (cursor->next(doc))
    {
        out << mongo_cloner::extended_json::encode(doc) << '\n';
        ++count;
    }

    out.close();

    if (!out)
        throw mongo_cloner::path_error("writing " + file.string() + " failed");

    log("  Finished " + name + " with " + std::to_string(count) + " documents.");
    return count;
}

std::size_t restore_collection(
      mongo_cloner::database_handle& destination
    , const mongo_cloner::dump_entry& entry
    , std::size_t batch_size
    , const progress_sink& log)
{
    log("Importing collection: " + entry._collection);

    std::ifstream in(entry._path.string(), std::ios::in | std::ios::binary);

    if (!in)
        throw mongo_cloner::path_error("cannot open " + entry._path.string() + " for reading");

    std::unique_ptr<mongo_cloner::collection_handle> to = destination.collection(entry._collection);
    mongo_cloner::batch_writer writer(*to, entry._collection, batch_size, log);

    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line))
    {
        ++line_number;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (is_blank(line))
            continue;

        mongo_cloner::document doc;

        try
        {
            doc = mongo_cloner::extended_json::decode(line);
        }
        catch (const mongo_cloner::decode_error& e)
        {
            throw mongo_cloner::decode_error(
                entry._path.filename().string() + " line " + std::to_string(line_number) + ": " + e.what());
        }

        writer.add(std::move(doc));
    }

    if (in.bad())
        throw mongo_cloner::path_error("reading " + entry._path.string() + " failed");

    writer.flush();

    log("  Finished " + entry._collection + " with " + std::to_string(writer.total()) + " documents.");
    return writer.total();
}
}

namespace mongo_cloner
{

const std::size_t default_batch_size = 1000;

replication_options::replication_options():
      _batch_size(default_batch_size)
    , _normalize_uri(true)
    , _isolate_collections(false)
{
}

operation_result::operation_result():
      _status(0)
    , _collections(0)
    , _documents(0)
    , _failed_collections(0)
{
}

replicator::replicator(connection_provider& provider, replication_options options):
      _provider(provider)
    , _options(options)
{
    if (_options._batch_size == 0)
        throw std::invalid_argument("batch size must be at least 1");
}

std::unique_ptr<database_handle> replicator::open(const std::string& uri, const std::string& db_name, const progress_sink& log) const
{
    if (!_options._normalize_uri)
        return _provider.connect(uri, db_name);

    const std::string normalized = normalize_uri(uri);

    if (normalized != uri)
        log("Normalized connection string (stripped '.' before port).");

    return _provider.connect(normalized, db_name);
}

operation_result replicator::direct_clone(
      const std::string& src_uri
    , const std::string& src_db
    , const std::string& dst_uri
    , const std::string& dst_db
    , const progress_sink& sink) const
{
    return run_operation("Direct clone", sink, [&](const progress_sink& log, operation_result& result)
    {
        std::unique_ptr<database_handle> source = open(src_uri, src_db, log);
        std::unique_ptr<database_handle> destination = open(dst_uri, dst_db, log);

        log("Starting direct clone from " + src_db + " to " + dst_db);

        for (const auto& name : list_collections(*source))
        {
            run_collection(name, _options._isolate_collections, log, result, [&]()
            {
                return clone_collection(*source, *destination, name, _options._batch_size, log);
            });
        }
    });
}

operation_result replicator::dump_to_file(
      const std::string& uri
    , const std::string& db_name
    , const std::string& output_directory
    , const progress_sink& sink) const
{
    return run_operation("Dump", sink, [&](const progress_sink& log, operation_result& result)
    {
        std::unique_ptr<database_handle> source = open(uri, db_name, log);

        log("Dumping database " + db_name + " to " + output_directory);

        const fs::path directory(output_directory);
        boost::system::error_code ec;

        fs::create_directories(directory, ec);

        if (ec || !fs::is_directory(directory, ec))
            throw path_error("cannot create directory " + output_directory + (ec ? ": " + ec.message() : std::string()));

        for (const auto& name : list_collections(*source))
        {
            run_collection(name, _options._isolate_collections, log, result, [&]()
            {
                return dump_collection(*source, name, directory, log);
            });
        }
    });
}

operation_result replicator::restore_from_file(
      const std::string& uri
    , const std::string& db_name
    , const std::string& input_directory
    , const progress_sink& sink) const
{
    return run_operation("Restore", sink, [&](const progress_sink& log, operation_result& result)
    {
        std::unique_ptr<database_handle> destination = open(uri, db_name, log);

        log("Restoring database " + db_name + " from " + input_directory);

        const fs::path directory(input_directory);
        boost::system::error_code ec;

        if (!fs::is_directory(directory, ec))
            throw path_error(input_directory + " is not a directory.");

        std::vector<dump_entry> entries;

        try
        {
            entries = list_dump_files(directory);
        }
        catch (const fs::filesystem_error& e)
        {
            throw path_error(std::string("cannot list ") + input_directory + ": " + e.what());
        }

        for (const auto& entry : entries)
        {
            run_collection(entry._collection, _options._isolate_collections, log, result, [&]()
            {
                return restore_collection(*destination, entry, _options._batch_size, log);
            });
        }
    });
}

}
