#include "rw_lock.hpp"

namespace kvstore {

    void RwLock::lock() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_writers_;
        writers_cv_.wait(lock, [this] {
            return !writer_active_ && active_readers_ == 0;
        });
        --waiting_writers_;
        writer_active_ = true;
    }

    bool RwLock::try_lock() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (writer_active_ || active_readers_ > 0) {
            return false;
        }
        writer_active_ = true;
        return true;
    }

    void RwLock::unlock() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            writer_active_ = false;
        }
        // Hand over to the next writer first; readers re-check the predicate.
        writers_cv_.notify_one();
        readers_cv_.notify_all();
    }

    void RwLock::lock_shared() {
        std::unique_lock<std::mutex> lock(mutex_);
        readers_cv_.wait(lock, [this] {
            return !writer_active_ && waiting_writers_ == 0;
        });
        ++active_readers_;
    }

    bool RwLock::try_lock_shared() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (writer_active_ || waiting_writers_ > 0) {
            return false;
        }
        ++active_readers_;
        return true;
    }

    void RwLock::unlock_shared() {
        bool wake_writer = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_readers_;
            wake_writer = active_readers_ == 0 && waiting_writers_ > 0;
        }
        if (wake_writer) {
            writers_cv_.notify_one();
        }
    }

}
