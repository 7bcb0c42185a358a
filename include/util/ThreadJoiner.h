#pragma once

#include <thread>
#include <vector>

// Joins every joinable thread in a pool when it goes out of scope, so an
// exception thrown while the pool is being filled never destroys a running
// std::thread.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& pool) : pool(pool) {}
    ~ThreadJoiner() { joinAll(); }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

    void joinAll() {
        for (auto& t : pool) {
            if (t.joinable()) t.join();
        }
    }

private:
    std::vector<std::thread>& pool;
};
