#pragma once


#include <queue>
#include <mutex>
#include <stdexcept>
#include <condition_variable>

namespace concurrency {

    template<class T>
    struct Result {
        T answer;
        bool ok;
    };


    /**
     * Unbounded multi-producer channel. Writers post by move, readers block until an element arrives or the
     * channel is closed. A closed channel is still drained: queued elements are handed out before reads fail.
     */
    template<class T>
    class Channel {
    private:

        bool closed = false;
        std::queue<T> q;
        mutable std::mutex m;
        std::condition_variable c;

        /**
         * USAGE: should be called when channel resources are locked!
         * @return the front element, or a failed result once the channel is closed and empty.
         */
        inline Result<T> pop_chan() {
            if (!q.empty()) {
                Result<T> out{std::move(q.front()), true};
                q.pop();
                return out;
            }
            if (closed) {
                return Result<T>{T(), false};
            }

            throw std::logic_error("Channel::pop_chan() - woke up on an open and empty channel.");
        }

    public:
        Channel() : q(), m(), c() {}

        ~Channel() {
            close();
        }

        // not allowing copy or moving of a channel.
        Channel(const Channel &) = delete;

        Channel(Channel &&) = delete;


        /**
         * Adds an element to the queue.
         * @throws std::logic_error if the channel was closed.
         */
        void write(T &&t) {
            std::lock_guard<std::mutex> lock(m);
            if (closed) {
                throw std::logic_error("Channel::write() - channel closed.");
            }
            q.push(std::move(t));
            c.notify_one();
        }

        /**
         * Get the "front"-element.
         * If there is nothing to read from the channel, wait till an element was written on another thread.
         */
        Result<T> read() {
            std::unique_lock<std::mutex> lock(m);
            c.wait(lock, [&] { return (!q.empty() || closed); });

            return pop_chan();
        }

        /**
         * Number of elements written and not yet read.
         */
        std::size_t pending() const {
            std::lock_guard<std::mutex> lock(m);
            return q.size();
        }

        /**
         * Closes the channel, anyone attempting to read from a closed and drained channel quickly receives a
         * read failure.
         */
        void close() {
            std::lock_guard<std::mutex> lock(m);
            closed = true;
            c.notify_all();
        }

    };
}
