#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace kvstore::test {

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{ 0 };
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() /
                ("kvstore_test_" + std::to_string(::getpid()) + "_" +
                    std::to_string(stamp) + "_" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        std::string file(const std::string& name) const {
            return (path_ / name).string();
        }

        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::string read_text(const std::string& path) {
        std::ifstream in(path);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline void write_text(const std::string& path, const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

}
