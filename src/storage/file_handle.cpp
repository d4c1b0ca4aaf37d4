#include "file_handle.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <fcntl.h>   // open()
#include <unistd.h>  // write(), fsync(), close()

namespace kvstore::storage {

    namespace {

        std::runtime_error io_error(const std::string& what, const std::string& path) {
            return std::runtime_error(what + " '" + path + "': " + std::strerror(errno));
        }

    }

    FileHandle::FileHandle() noexcept : fd_(-1) {}

    FileHandle::FileHandle(int fd) noexcept : fd_(fd) {}

    FileHandle::~FileHandle() {
        if (fd_ != -1) {
            ::close(fd_);
        }
    }

    FileHandle::FileHandle(FileHandle&& other) noexcept
        : fd_(other.fd_), path_(std::move(other.path_)) {
        other.fd_ = -1;
    }

    FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
        if (this != &other) {
            if (fd_ != -1) {
                ::close(fd_);
            }
            fd_ = other.fd_;
            path_ = std::move(other.path_);
            other.fd_ = -1;
        }
        return *this;
    }

    FileHandle FileHandle::open(const std::string& path, int flags, int mode) {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        if (fd == -1) {
            throw io_error("cannot open", path);
        }
        FileHandle handle(fd);
        handle.path_ = path;
        return handle;
    }

    void FileHandle::write_all(std::string_view data) {
        const char* ptr = data.data();
        size_t remaining = data.size();
        while (remaining > 0) {
            ssize_t n = ::write(fd_, ptr, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw io_error("write failed on", path_);
            }
            ptr += n;
            remaining -= static_cast<size_t>(n);
        }
    }

    void FileHandle::sync() {
        if (::fsync(fd_) != 0) {
            throw io_error("fsync failed on", path_);
        }
    }

    void FileHandle::truncate(size_t length) {
        if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
            throw io_error("truncate failed on", path_);
        }
    }

    void FileHandle::close() {
        if (fd_ == -1) {
            return;
        }
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            throw io_error("close failed on", path_);
        }
    }

}
