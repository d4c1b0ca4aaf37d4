#pragma once
#include <optional>
#include <string>

namespace kvstore::storage {

    // Whole-file read. Returns nullopt if the file does not exist and throws
    // if the path is not a regular file or cannot be read.
    std::optional<std::string> read_file(const std::string& path);

    // Replaces `path` with `content` via <path>.tmp + rename, so readers see
    // either the old file or the new one. With `durable`, the temp file and
    // the parent directory are fsynced.
    // Throws if the new contents could not be put in place; the temp file is
    // removed on every such failure. Returns false when the rename succeeded
    // but the directory fsync did not.
    bool write_file_atomically(const std::string& path, const std::string& content, bool durable);

    void sync_parent_directory(const std::string& path);

    void ensure_parent_directory(const std::string& path);

}
