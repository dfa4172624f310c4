#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace mongo_cloner
{
    // Receives one human readable line per call, in order.
    typedef std::function<void(const std::string& line)> progress_sink;

    class progress_channel
    {
        private:
        std::deque<std::string> _lines;
        mutable std::mutex _mutex;
        std::condition_variable _not_empty;
        bool _closed;

        public:
        progress_channel();

        progress_channel(const progress_channel&) = delete;
        progress_channel& operator=(const progress_channel&) = delete;

        void push(const std::string& line);
        bool pop(std::string& line);
        void close();

        bool closed() const;
        std::size_t size() const;

        // Sink that forwards into this channel. The channel must outlive it.
        progress_sink sink();
    };
}
