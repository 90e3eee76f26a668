/*
    Copyright 2019-2025 Hydr8gon

    This file is part of GeoDS.

    GeoDS is free software: you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    GeoDS is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
    General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with GeoDS. If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef COMMAND_QUEUE_H
#define COMMAND_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Fixed-size thread-safe FIFO
// Pushing blocks while the queue is full, and popping blocks while it's empty
// Once stopped, pushes fail right away and pops drain what's left before failing
template <typename T>
class CommandQueue
{
    public:
        CommandQueue(size_t capacity): capacity(capacity > 0 ? capacity : 1) {}

        CommandQueue(const CommandQueue&) = delete;
        CommandQueue &operator=(const CommandQueue&) = delete;

        bool push(const T &item)
        {
            // Wait until there's room for the item or the queue is stopped
            std::unique_lock<std::mutex> lock(mutex);
            hasRoom.wait(lock, [this] { return !running || queue.size() < capacity; });
            if (!running) return false;

            // Add the item and wake the consumer
            queue.push_back(item);
            lock.unlock();
            hasItems.notify_one();
            return true;
        }

        bool pop(T &item)
        {
            // Wait until an item is available or the queue is stopped
            std::unique_lock<std::mutex> lock(mutex);
            hasItems.wait(lock, [this] { return !running || !queue.empty(); });
            if (queue.empty()) return false;

            // Take the front item and wake a producer
            item = queue.front();
            queue.pop_front();
            lock.unlock();
            hasRoom.notify_one();
            return true;
        }

        void start()
        {
            std::lock_guard<std::mutex> guard(mutex);
            running = true;
        }

        void stop()
        {
            {
                std::lock_guard<std::mutex> guard(mutex);
                if (!running) return;
                running = false;
            }

            // Release anything waiting on either side
            hasItems.notify_all();
            hasRoom.notify_all();
        }

        void clear()
        {
            {
                std::lock_guard<std::mutex> guard(mutex);
                queue.clear();
            }
            hasRoom.notify_all();
        }

        size_t size()
        {
            std::lock_guard<std::mutex> guard(mutex);
            return queue.size();
        }

        bool isRunning()
        {
            std::lock_guard<std::mutex> guard(mutex);
            return running;
        }

        size_t getCapacity() const { return capacity; }

    private:
        std::deque<T> queue;
        std::mutex mutex;
        std::condition_variable hasRoom;
        std::condition_variable hasItems;
        const size_t capacity;
        bool running = true;
};

#endif // COMMAND_QUEUE_H
