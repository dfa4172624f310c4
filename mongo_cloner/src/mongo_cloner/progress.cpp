#include "mongo_cloner/progress.hpp"

namespace mongo_cloner
{

progress_channel::progress_channel(): _closed(false)
{
}

void progress_channel::push(const std::string& line)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);

        // Lines pushed after close() have no reader left.
        if (_closed)
            return;

        _lines.push_back(line);
    }

    _not_empty.notify_one();
}

bool progress_channel::pop(std::string& line)
{
    std::unique_lock<std::mutex> lock(_mutex);

    _not_empty.wait(lock, [this] { return !_lines.empty() || _closed; });

    if (_lines.empty())
        return false;

    line = std::move(_lines.front());
    _lines.pop_front();
    return true;
}

void progress_channel::close()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
    }

    _not_empty.notify_all();
}

bool progress_channel::closed() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
}

std::size_t progress_channel::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _lines.size();
}

progress_sink progress_channel::sink()
{
    return [this](const std::string& line) { push(line); };
}

}
