#include "mongo_cloner/command_line.hpp"
#include "stdafx.hpp"

#include <fstream>
#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace
{
struct option_set
{
    po::options_description _general;
    po::options_description _connection;
    po::options_description _hidden;
    po::options_description _visible;
    po::options_description _all;
    po::positional_options_description _positional;

    option_set():
          _general("General options")
        , _connection("Connection options")
    {
        _general.add_options()
            ("help,h", "print this help")
            ("config", po::value<std::string>(), "read options from an INI style file; command line wins")
            ("batch-size", po::value<long long>()->default_value(static_cast<long long>(mongo_cloner::default_batch_size)),
                "upserts per bulk write, at least 1")
            ("no-uri-fix", po::bool_switch(), "do not strip a '.' in front of ':<port>' in connection strings")
            ("isolate-collections", po::bool_switch(), "log a failing collection and continue with the next one");

        _connection.add_options()
            ("src-uri", po::value<std::string>(), "clone: source connection string")
            ("src-db", po::value<std::string>(), "clone: source database")
            ("dst-uri", po::value<std::string>(), "clone: destination connection string")
            ("dst-db", po::value<std::string>(), "clone: destination database")
            ("uri", po::value<std::string>(), "dump/restore: connection string")
            ("db", po::value<std::string>(), "dump/restore: database")
            ("out", po::value<std::string>(), "dump: output directory, created if missing")
            ("in", po::value<std::string>(), "restore: directory holding <collection>.json files");

        _hidden.add_options()
            ("mode", po::value<std::string>(), "clone, dump or restore");

        _visible.add(_general).add(_connection);
        _all.add(_visible).add(_hidden);
        _positional.add("mode", 1);
    }
};

std::string required(const po::variables_map& vm, const char* name)
{
    if (!vm.count(name) || vm[name].as<std::string>().empty())
        throw mongo_cloner::usage_error(std::string("the option '--") + name + "' is required");

    return vm[name].as<std::string>();
}
}

namespace mongo_cloner
{

usage_error::usage_error(const std::string& message): std::runtime_error(message)
{
}

command_line::command_line():
      _help(false)
{
}

command_line parse_command_line(int argc, const char* const argv[])
{
    option_set options;
    po::variables_map vm;

    try
    {
        po::store(po::command_line_parser(argc, argv).options(options._all).positional(options._positional).run(), vm);

        if (vm.count("config"))
        {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream config(path);

            if (!config)
                throw usage_error("cannot read config file " + path);

            po::store(po::parse_config_file(config, options._visible), vm);
        }

        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw usage_error(e.what());
    }

    command_line result;

    if (vm.count("help"))
    {
        result._help = true;
        return result;
    }

    result._mode = vm.count("mode") ? vm["mode"].as<std::string>() : std::string();

    if (result._mode.empty())
        throw usage_error("missing mode");

    // A size_t option would turn -1 into SIZE_MAX.
    const long long batch_size = vm["batch-size"].as<long long>();

    if (batch_size < 1)
        throw usage_error("--batch-size must be at least 1");

    result._options._batch_size = static_cast<std::size_t>(batch_size);
    result._options._normalize_uri = !vm["no-uri-fix"].as<bool>();
    result._options._isolate_collections = vm["isolate-collections"].as<bool>();

    if (result._mode == "clone")
    {
        result._src_uri = required(vm, "src-uri");
        result._src_db = required(vm, "src-db");
        result._dst_uri = required(vm, "dst-uri");
        result._dst_db = required(vm, "dst-db");
    }
    else if (result._mode == "dump")
    {
        result._uri = required(vm, "uri");
        result._db = required(vm, "db");
        result._directory = required(vm, "out");
    }
    else if (result._mode == "restore")
    {
        result._uri = required(vm, "uri");
        result._db = required(vm, "db");
        result._directory = required(vm, "in");
    }
    else
    {
        throw usage_error("unknown mode '" + result._mode + "'");
    }

    return result;
}

std::string usage()
{
    option_set options;
    std::ostringstream out;

    out << "Copy a MongoDB database directly or through Extended JSON dump files.\n\n"
        << "usage: mongo_cloner clone   --src-uri URI --src-db DB --dst-uri URI --dst-db DB [options]\n"
        << "       mongo_cloner dump    --uri URI --db DB --out DIR [options]\n"
        << "       mongo_cloner restore --uri URI --db DB --in DIR [options]\n\n"
        << "Deprecated BSON kinds (undefined, symbol, DBPointer, code with scope) are copied unchanged.\n\n"
        << options._visible;

    return out.str();
}

}
