#include "file_io.hpp"
#include "file_handle.hpp"

#include <cerrno>
#include <cstdio>    // std::rename
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace kvstore::storage {

    std::optional<std::string> read_file(const std::string& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }

        if (!fs::is_regular_file(path, ec)) {
            throw std::runtime_error("'" + path + "' is not a regular file");
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("cannot open '" + path + "' for reading");
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            throw std::runtime_error("read failed on '" + path + "'");
        }
        return buffer.str();
    }

    bool write_file_atomically(const std::string& path, const std::string& content, bool durable) {
        const std::string tmp_path = path + ".tmp";

        try {
            FileHandle tmp = FileHandle::open(tmp_path, O_WRONLY | O_CREAT | O_TRUNC);
            try {
                tmp.write_all(content);
                if (durable) {
                    tmp.sync();
                }
                tmp.close();
            }
            catch (const std::exception&) {
                std::error_code ec;
                fs::remove(tmp_path, ec);
                throw;
            }
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("writing '") + tmp_path + "' failed: " + e.what());
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            std::string reason = std::strerror(errno);
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw std::runtime_error("rename '" + tmp_path + "' -> '" + path + "' failed: " + reason);
        }

        // The new contents are in place from here on; a failed directory
        // sync only weakens durability.
        if (durable) {
            try {
                sync_parent_directory(path);
            }
            catch (const std::exception&) {
                return false;
            }
        }
        return true;
    }

    void sync_parent_directory(const std::string& path) {
        fs::path parent = fs::path(path).parent_path();
        if (parent.empty()) {
            parent = ".";
        }
        FileHandle dir = FileHandle::open(parent.string(), O_RDONLY | O_DIRECTORY);
        dir.sync();
    }

    void ensure_parent_directory(const std::string& path) {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
    }

}
