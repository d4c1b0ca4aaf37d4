#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace kvstore {

    class KvStoreError : public std::runtime_error {
    public:
        explicit KvStoreError(const std::string& msg) : std::runtime_error(msg) {}
    };

    class InvalidKeyError : public KvStoreError {
    public:
        InvalidKeyError(const std::string& key, const std::string& reason)
            : KvStoreError("invalid key '" + key + "': " + reason), key_(key) {
        }

        const std::string& key() const { return key_; }

    private:
        std::string key_;
    };

    class InvalidValueError : public KvStoreError {
    public:
        explicit InvalidValueError(const std::string& reason)
            : KvStoreError("invalid value: " + reason) {
        }
    };

    class SerializationError : public KvStoreError {
    public:
        explicit SerializationError(const std::string& reason)
            : KvStoreError("value cannot be serialized: " + reason) {
        }
    };

    class KeyNotFoundError : public KvStoreError {
    public:
        explicit KeyNotFoundError(const std::string& key)
            : KvStoreError("key '" + key + "' not found"), key_(key) {
        }

        const std::string& key() const { return key_; }

    private:
        std::string key_;
    };

    class CorruptedStoreError : public KvStoreError {
    public:
        CorruptedStoreError(const std::string& path, const std::string& reason)
            : KvStoreError("corrupted data file '" + path + "': " + reason) {
        }
    };

    class CorruptedLogError : public KvStoreError {
    public:
        CorruptedLogError(const std::string& path, size_t line, const std::string& reason)
            : KvStoreError("corrupted log file '" + path + "' at line "
                + std::to_string(line) + ": " + reason), line_(line) {
        }

        size_t line() const { return line_; }

    private:
        size_t line_;
    };

    class StorePersistenceError : public KvStoreError {
    public:
        explicit StorePersistenceError(const std::string& msg)
            : KvStoreError("failed to persist data file: " + msg) {
        }
    };

    class LogPersistenceError : public KvStoreError {
    public:
        explicit LogPersistenceError(const std::string& msg)
            : KvStoreError("failed to persist transaction log: " + msg) {
        }
    };

}
