#include "mongo_cloner/command_line.hpp"
#include "mongo_cloner/mongo_connection.hpp"
#include "mongo_cloner/progress.hpp"
#include "mongo_cloner/replicator.hpp"
#include "stdafx.hpp"

#include <thread>

namespace
{
const int usage_status = 2;

// Runs the operation on a worker thread and prints its progress here, in order.
int run(const mongo_cloner::replicator& replicator, const mongo_cloner::command_line& cmd)
{
    mongo_cloner::progress_channel channel;
    mongo_cloner::progress_sink sink = channel.sink();
    mongo_cloner::operation_result result;

    std::thread worker([&]()
    {
        try
        {
            if (cmd._mode == "clone")
                result = replicator.direct_clone(cmd._src_uri, cmd._src_db, cmd._dst_uri, cmd._dst_db, sink);
            else if (cmd._mode == "dump")
                result = replicator.dump_to_file(cmd._uri, cmd._db, cmd._directory, sink);
            else
                result = replicator.restore_from_file(cmd._uri, cmd._db, cmd._directory, sink);
        }
        catch (const std::exception& e)
        {
            channel.push(std::string("ERROR: ") + e.what());
            result._status = 1;
        }
        catch (...)
        {
            channel.push("ERROR: unknown error");
            result._status = 1;
        }

        channel.close();
    });

    std::string line;

    while (channel.pop(line))
        std::cout << line << std::endl;

    worker.join();

    return result._status;
}
}

int main(int argc, char **argv)
{
    mongo_cloner::command_line cmd;

    try
    {
        cmd = mongo_cloner::parse_command_line(argc, argv);
    }
    catch (const mongo_cloner::usage_error& e)
    {
        std::cerr << e.what() << "\n\n" << mongo_cloner::usage() << std::flush;
        return usage_status;
    }

    if (cmd._help)
    {
        std::cout << mongo_cloner::usage() << std::flush;
        return 0;
    }

    mongo_cloner::mongo_connection_provider provider;
    mongo_cloner::replicator replicator(provider, cmd._options);

    return run(replicator, cmd);
}
