#include "mongo_cloner/mongo_cloner_c_api.h"
#include "mongo_cloner/mongo_connection.hpp"
#include "mongo_cloner/replicator.hpp"
#include "stdafx.hpp"

namespace
{
std::string from_c(const char* s)
{
    return s ? std::string(s) : std::string();
}

mongo_cloner::progress_sink make_sink(const void* context, mongo_cloner_on_log_callback_f on_log)
{
    if (!on_log)
        return mongo_cloner::progress_sink();

    return [context, on_log](const std::string& line) { on_log(context, line.c_str()); };
}

mongo_cloner::replication_options make_options(unsigned int batch_size)
{
    mongo_cloner::replication_options options;

    if (batch_size > 0)
        options._batch_size = batch_size;

    return options;
}

// Nothing may unwind across the C boundary.
template <typename Call>
int guarded(const void* context, mongo_cloner_on_log_callback_f on_log, Call call)
{
    try
    {
        return call();
    }
    catch (const std::exception& e)
    {
        if (on_log)
            on_log(context, (std::string("ERROR: ") + e.what()).c_str());
    }
    catch (...)
    {
        if (on_log)
            on_log(context, "ERROR: unknown error");
    }

    return 1;
}
}

int mongo_cloner_direct_clone(
      const char* src_uri
    , const char* src_db
    , const char* dst_uri
    , const char* dst_db
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log)
{
    return guarded(context, on_log, [&]()
    {
        mongo_cloner::mongo_connection_provider provider;
        mongo_cloner::replicator replicator(provider, make_options(batch_size));

        return replicator.direct_clone(
              from_c(src_uri)
            , from_c(src_db)
            , from_c(dst_uri)
            , from_c(dst_db)
            , make_sink(context, on_log))._status;
    });
}

int mongo_cloner_dump_to_file(
      const char* uri
    , const char* db_name
    , const char* output_directory
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log)
{
    return guarded(context, on_log, [&]()
    {
        mongo_cloner::mongo_connection_provider provider;
        mongo_cloner::replicator replicator(provider, make_options(batch_size));

        return replicator.dump_to_file(
              from_c(uri)
            , from_c(db_name)
            , from_c(output_directory)
            , make_sink(context, on_log))._status;
    });
}

int mongo_cloner_restore_from_file(
      const char* uri
    , const char* db_name
    , const char* input_directory
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log)
{
    return guarded(context, on_log, [&]()
    {
        mongo_cloner::mongo_connection_provider provider;
        mongo_cloner::replicator replicator(provider, make_options(batch_size));

        return replicator.restore_from_file(
              from_c(uri)
            , from_c(db_name)
            , from_c(input_directory)
            , make_sink(context, on_log))._status;
    });
}
