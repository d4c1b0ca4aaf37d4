#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace kvstore {

    /*
     * Writer-preferring reader-writer lock.
     * Satisfies SharedMutex, so std::unique_lock / std::shared_lock work with it.
     * Once a writer is waiting, new readers queue behind it; readers already
     * inside finish normally. std::shared_mutex gives no such guarantee on
     * glibc, where pthread rwlocks prefer readers.
     */
    class RwLock {
    public:
        RwLock() = default;
        RwLock(const RwLock&) = delete;
        RwLock& operator=(const RwLock&) = delete;

        void lock();
        bool try_lock();
        void unlock();

        void lock_shared();
        bool try_lock_shared();
        void unlock_shared();

    private:
        std::mutex mutex_;
        std::condition_variable readers_cv_;
        std::condition_variable writers_cv_;

        size_t active_readers_ = 0;
        size_t waiting_writers_ = 0;
        bool writer_active_ = false;
    };

}
