#pragma once

#include <thread>
#include <vector>

// Joins every joinable thread in the referenced vector when it goes out of
// scope, so an exception thrown while workers are being started cannot
// destroy a running std::thread.
class ThreadJoiner {
  public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() { join_all(); }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

    void join_all() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

  private:
    std::vector<std::thread>& threads_;
};
