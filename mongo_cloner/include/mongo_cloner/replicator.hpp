#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "mongo_cloner/progress.hpp"

namespace mongo_cloner
{
    class connection_provider;
    class database_handle;

    extern const std::size_t default_batch_size;

    struct replication_options
    {
        // Upserts per bulk write.
        std::size_t _batch_size;

        // Strip the '.' in "host.:port" before connecting.
        bool _normalize_uri;

        // Log a failing collection and carry on with the next one instead of
        // abandoning the run. The run still reports failure.
        bool _isolate_collections;

        replication_options();
    };

    struct operation_result
    {
        int _status;
        std::size_t _collections;
        std::size_t _documents;
        std::size_t _failed_collections;
        std::vector<std::string> _log;

        operation_result();

        bool ok() const { return _status == 0; }
    };

    class replicator
    {
        private:
        connection_provider& _provider;
        replication_options _options;

        std::unique_ptr<database_handle> open(const std::string& uri, const std::string& db_name, const progress_sink& log) const;

        public:
        explicit replicator(connection_provider& provider, replication_options options = replication_options());

        const replication_options& options() const { return _options; }

        operation_result direct_clone(
              const std::string& src_uri
            , const std::string& src_db
            , const std::string& dst_uri
            , const std::string& dst_db
            , const progress_sink& sink = progress_sink()) const;

        operation_result dump_to_file(
              const std::string& uri
            , const std::string& db_name
            , const std::string& output_directory
            , const progress_sink& sink = progress_sink()) const;

        operation_result restore_from_file(
              const std::string& uri
            , const std::string& db_name
            , const std::string& input_directory
            , const progress_sink& sink = progress_sink()) const;
    };
}
