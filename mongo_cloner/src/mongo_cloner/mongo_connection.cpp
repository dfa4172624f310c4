#include "mongo_cloner/mongo_connection.hpp"
#include "mongo_cloner/bson_convert.hpp"
#include "mongo_cloner/errors.hpp"
#include <mongoc/mongoc.h>
#include "stdafx.hpp"

namespace
{
// mongoc_init()/mongoc_cleanup() once per process.
struct mongoc_library
{
    mongoc_library() { mongoc_init(); }
    ~mongoc_library() { mongoc_cleanup(); }
};

void ensure_mongoc_initialized()
{
    static mongoc_library library;
}

typedef std::unique_ptr<bson_t, decltype(&bson_destroy)> bson_ptr;

// Stack bson_t that is destroyed on every exit path.
struct scoped_bson
{
    bson_t _bson;

    scoped_bson() { bson_init(&_bson); }
    ~scoped_bson() { bson_destroy(&_bson); }

    scoped_bson(const scoped_bson&) = delete;
    scoped_bson& operator=(const scoped_bson&) = delete;

    bson_t* get() { return &_bson; }
};

std::string reply_text(const bson_t* reply)
{
    char* str = bson_as_relaxed_extended_json(reply, NULL);

    if (!str)
        return std::string();

    std::string text(str);
    bson_free(str);
    return text;
}

class mongo_client
{
    private:
    mongoc_uri_t* _uri;
    mongoc_client_t* _client;

    public:
    mongo_client(const std::string& uri_string, const std::string& appname):
          _uri(nullptr)
        , _client(nullptr)
    {
        ensure_mongoc_initialized();

        bson_error_t error;

        _uri = mongoc_uri_new_with_error(uri_string.c_str(), &error);

        // The connection string may carry credentials; report only the parser's message.
        if (!_uri)
            throw mongo_cloner::connection_error(std::string("failed to parse connection string: ") + error.message);

        _client = mongoc_client_new_from_uri(_uri);

        if (!_client)
        {
            mongoc_uri_destroy(_uri);
            throw mongo_cloner::connection_error("failed to create a client for the connection string");
        }

        mongoc_client_set_appname(_client, appname.c_str());
        mongoc_client_set_error_api(_client, MONGOC_ERROR_API_VERSION_2);
    }

    ~mongo_client()
    {
        mongoc_client_destroy(_client);
        mongoc_uri_destroy(_uri);
    }

    mongo_client(const mongo_client&) = delete;
    mongo_client& operator=(const mongo_client&) = delete;

    mongoc_client_t* get() const { return _client; }

    void ping()
    {
        bson_ptr command(BCON_NEW("ping", BCON_INT32(1)), &bson_destroy);
        scoped_bson reply;
        bson_error_t error;

        if (!mongoc_client_command_simple(_client, "admin", command.get(), NULL, reply.get(), &error))
            throw mongo_cloner::connection_error(std::string("cannot reach server: ") + error.message);
    }
};

class mongo_cursor : public mongo_cloner::document_cursor
{
    private:
    std::shared_ptr<mongo_client> _client;
    std::unique_ptr<mongoc_cursor_t, decltype(&mongoc_cursor_destroy)> _cursor;
    std::string _collection_name;

    public:
    mongo_cursor(std::shared_ptr<mongo_client> client, mongoc_cursor_t* cursor, std::string collection_name):
          _client(std::move(client))
        , _cursor(cursor, &mongoc_cursor_destroy)
        , _collection_name(std::move(collection_name))
    {
    }

    bool next(mongo_cloner::document& doc) override
    {
        const bson_t* current = nullptr;

        if (mongoc_cursor_next(_cursor.get(), &current))
        {
            doc = mongo_cloner::from_bson(current);
            return true;
        }

        bson_error_t error;

        if (mongoc_cursor_error(_cursor.get(), &error))
            throw mongo_cloner::connection_error("reading " + _collection_name + " failed: " + error.message);

        return false;
    }
};

class mongo_collection : public mongo_cloner::collection_handle
{
    private:
    std::shared_ptr<mongo_client> _client;
    std::unique_ptr<mongoc_collection_t, decltype(&mongoc_collection_destroy)> _collection;
    std::string _name;

    public:
    mongo_collection(std::shared_ptr<mongo_client> client, const std::string& db_name, const std::string& name):
          _client(std::move(client))
        , _collection(mongoc_client_get_collection(_client->get(), db_name.c_str(), name.c_str()), &mongoc_collection_destroy)
        , _name(name)
    {
    }

    const std::string& name() const override { return _name; }

    std::unique_ptr<mongo_cloner::document_cursor> find_all() override
    {
        scoped_bson filter;
        mongoc_cursor_t* cursor = mongoc_collection_find_with_opts(_collection.get(), filter.get(), NULL, NULL);

        return std::unique_ptr<mongo_cloner::document_cursor>(new mongo_cursor(_client, cursor, _name));
    }

    void bulk_upsert(const std::vector<mongo_cloner::document>& docs) override
    {
        if (docs.empty())
            return;

        bson_ptr bulk_opts(BCON_NEW("ordered", BCON_BOOL(false)), &bson_destroy);
        bson_ptr replace_opts(BCON_NEW("upsert", BCON_BOOL(true)), &bson_destroy);

        std::unique_ptr<mongoc_bulk_operation_t, decltype(&mongoc_bulk_operation_destroy)> bulk(
              mongoc_collection_create_bulk_operation_with_opts(_collection.get(), bulk_opts.get())
            , &mongoc_bulk_operation_destroy);

        bson_error_t error;

        for (const auto& doc : docs)
        {
            scoped_bson selector;
            scoped_bson replacement;

            mongo_cloner::to_bson(mongo_cloner::document{{mongo_cloner::id_field, doc.id()}}, selector.get());
            mongo_cloner::to_bson(doc, replacement.get());

            if (!mongoc_bulk_operation_replace_one_with_opts(
                    bulk.get(), selector.get(), replacement.get(), replace_opts.get(), &error))
                throw mongo_cloner::write_error("cannot queue upsert into " + _name + ": " + error.message);
        }

        scoped_bson reply;

        if (!mongoc_bulk_operation_execute(bulk.get(), reply.get(), &error))
        {
            throw mongo_cloner::write_error(
                "bulk upsert into " + _name + " failed: " + error.message + " " + reply_text(reply.get()));
        }
    }
};

class mongo_database : public mongo_cloner::database_handle
{
    private:
    std::shared_ptr<mongo_client> _client;
    std::string _name;

    public:
    mongo_database(std::shared_ptr<mongo_client> client, std::string name):
          _client(std::move(client))
        , _name(std::move(name))
    {
    }

    const std::string& name() const override { return _name; }

    std::vector<std::string> collection_names() override
    {
        std::unique_ptr<mongoc_database_t, decltype(&mongoc_database_destroy)> database(
              mongoc_client_get_database(_client->get(), _name.c_str())
            , &mongoc_database_destroy);

        bson_error_t error;
        char** names = mongoc_database_get_collection_names_with_opts(database.get(), NULL, &error);

        if (!names)
            throw mongo_cloner::connection_error("listing collections of " + _name + " failed: " + error.message);

        std::vector<std::string> result;

        for (char** name = names; *name; ++name)
            result.emplace_back(*name);

        bson_strfreev(names);
        return result;
    }

    std::unique_ptr<mongo_cloner::collection_handle> collection(const std::string& name) override
    {
        return std::unique_ptr<mongo_cloner::collection_handle>(new mongo_collection(_client, _name, name));
    }
};
}

namespace mongo_cloner
{

mongo_connection_provider::mongo_connection_provider(std::string appname):
      _appname(std::move(appname))
{
}

std::unique_ptr<database_handle> mongo_connection_provider::connect(const std::string& uri, const std::string& db_name)
{
    if (db_name.empty())
        throw connection_error("database name is empty");

    auto client = std::make_shared<mongo_client>(uri, _appname);

    client->ping();

    return std::unique_ptr<database_handle>(new mongo_database(client, db_name));
}

}
