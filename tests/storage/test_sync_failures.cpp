#include <gtest/gtest.h>
#include "kvstore.hpp"
#include "storage/file_io.hpp"
#include "test_util.hpp"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace {

    enum class SyncFault { None, Directories, Files };

    std::atomic<SyncFault> g_sync_fault{ SyncFault::None };

    // Arms a fault for the lifetime of the scope.
    class ScopedSyncFault {
    public:
        explicit ScopedSyncFault(SyncFault fault) { g_sync_fault = fault; }
        ~ScopedSyncFault() { g_sync_fault = SyncFault::None; }
    };

}

// Replaces libc's fsync for this test binary. Passes through unless a fault
// is armed for the kind of descriptor being synced.
extern "C" int fsync(int fd) {
    SyncFault fault = g_sync_fault.load();
    if (fault != SyncFault::None) {
        struct stat st;
        if (::fstat(fd, &st) == 0) {
            bool is_dir = S_ISDIR(st.st_mode);
            if ((fault == SyncFault::Directories && is_dir) ||
                (fault == SyncFault::Files && !is_dir)) {
                errno = EIO;
                return -1;
            }
        }
    }
    return static_cast<int>(::syscall(SYS_fsync, fd));
}

using namespace kvstore;

TEST(SyncFailureTest, DirectorySyncFailureStillReplacesFile) {
    test::TempDir dir;
    const std::string path = dir.file("data.json");
    ASSERT_TRUE(storage::write_file_atomically(path, "old", true));

    ScopedSyncFault fault(SyncFault::Directories);
    EXPECT_FALSE(storage::write_file_atomically(path, "new", true));
    EXPECT_EQ(test::read_text(path), "new");
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST(SyncFailureTest, FileSyncFailureRemovesTempFile) {
    test::TempDir dir;
    const std::string path = dir.file("data.json");
    ASSERT_TRUE(storage::write_file_atomically(path, "committed", true));

    ScopedSyncFault fault(SyncFault::Files);
    EXPECT_THROW(storage::write_file_atomically(path, "lost", true), std::runtime_error);
    EXPECT_EQ(test::read_text(path), "committed");
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST(SyncFailureTest, StoreKeepsMutationWhenDirectorySyncFails) {
    test::TempDir dir;
    StoreConfig store_config;
    store_config.data_file = dir.file("data.json");
    store_config.durable_writes = true;

    auto logger = create_transaction_logger(LoggerConfig{});
    auto store = create_kv_store(store_config, logger);

    {
        ScopedSyncFault fault(SyncFault::Directories);
        EXPECT_NO_THROW(store->put("a", "1"));
        EXPECT_NO_THROW(store->put("b", "2"));
        EXPECT_NO_THROW(store->remove("b"));
    }

    // Memory, file and log agree on what happened.
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->get("a"), "1");
    EXPECT_EQ(json::parse(test::read_text(store_config.data_file)), (json{ {"a", "1"} }));
    EXPECT_EQ(logger->size(), 3u);

    auto reopened = create_kv_store(store_config, create_transaction_logger(LoggerConfig{}));
    EXPECT_EQ(reopened->list_keys(), std::vector<std::string>{ "a" });
}

TEST(SyncFailureTest, StoreRollsBackWhenFileSyncFails) {
    test::TempDir dir;
    StoreConfig store_config;
    store_config.data_file = dir.file("data.json");
    store_config.durable_writes = true;

    auto logger = create_transaction_logger(LoggerConfig{});
    auto store = create_kv_store(store_config, logger);
    store->put("a", "1");

    {
        ScopedSyncFault fault(SyncFault::Files);
        EXPECT_THROW(store->put("a", "2"), StorePersistenceError);
    }

    EXPECT_EQ(store->get("a"), "1");
    EXPECT_EQ(json::parse(test::read_text(store_config.data_file)), (json{ {"a", "1"} }));
    EXPECT_FALSE(std::filesystem::exists(store_config.data_file + ".tmp"));
    EXPECT_EQ(logger->size(), 1u);
}
