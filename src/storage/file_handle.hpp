#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace kvstore::storage {

    /*
     * RAII owner of a POSIX file descriptor. Move-only.
     * I/O helpers throw std::runtime_error carrying errno text.
     */
    class FileHandle {
    public:
        FileHandle() noexcept;
        explicit FileHandle(int fd) noexcept;
        ~FileHandle();

        FileHandle(const FileHandle&) = delete;
        FileHandle& operator=(const FileHandle&) = delete;

        FileHandle(FileHandle&& other) noexcept;
        FileHandle& operator=(FileHandle&& other) noexcept;

        static FileHandle open(const std::string& path, int flags, int mode = 0644);

        bool valid() const noexcept { return fd_ != -1; }
        int fd() const noexcept { return fd_; }

        // Writes the whole buffer, retrying on short writes and EINTR.
        void write_all(std::string_view data);
        void sync();
        void truncate(size_t length);
        void close();

    private:
        int fd_;
        std::string path_;
    };

}
