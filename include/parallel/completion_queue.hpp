#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace parallel {

// Worker ids in the order their searches finished.
//
// Workers call mark_finished() exactly once; the coordinator calls
// next_finished() once per worker, blocking until another id arrives.
class CompletionQueue {
public:
    void mark_finished(int worker_id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(worker_id);
        }
        ready_.notify_one();
    }

    int next_finished() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !finished_.empty(); });
        int worker_id = finished_.front();
        finished_.pop_front();
        return worker_id;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<int> finished_;
};

} // namespace parallel
