#include "kv_store.hpp"
#include "../../include/kvstore/exceptions.hpp"
#include "../storage/file_io.hpp"

#include <cmath>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace kvstore {

    namespace {

        bool all_numbers_finite(const json& value) {
            if (value.is_number_float()) {
                return std::isfinite(value.get<double>());
            }
            if (value.is_structured()) {
                for (const auto& element : value) {
                    if (!all_numbers_finite(element)) {
                        return false;
                    }
                }
            }
            return true;
        }

        std::string current_thread_id() {
            std::ostringstream out;
            out << std::this_thread::get_id();
            return out.str();
        }

    }

    KvStoreImpl::KvStoreImpl(const StoreConfig& config, std::shared_ptr<ITransactionLogger> logger)
        : config_(config)
        , logger_(std::move(logger))
        , data_(json::object())
    {
        if (!logger_) {
            throw std::invalid_argument("KvStore requires a transaction logger");
        }
        if (!config_.data_file.empty()) {
            load();
        }
    }

    void KvStoreImpl::load() {
        std::optional<std::string> content;
        try {
            storage::ensure_parent_directory(config_.data_file);
            content = storage::read_file(config_.data_file);
        }
        catch (const std::exception& e) {
            std::cerr << "[KvStore] " << e.what() << std::endl;
            throw CorruptedStoreError(config_.data_file, e.what());
        }

        if (!content || content->find_first_not_of(" \t\r\n") == std::string::npos) {
            return;
        }

        json loaded = json::parse(*content, nullptr, false);
        if (loaded.is_discarded()) {
            std::cerr << "[KvStore] " << config_.data_file << " is not valid JSON" << std::endl;
            throw CorruptedStoreError(config_.data_file, "invalid JSON");
        }
        if (!loaded.is_object()) {
            std::cerr << "[KvStore] " << config_.data_file << " does not hold a JSON object" << std::endl;
            throw CorruptedStoreError(config_.data_file, "top level is not an object");
        }

        data_ = std::move(loaded);
        if (config_.verbose) {
            std::cout << "[KvStore] Loaded " << data_.size() << " entries from "
                << config_.data_file << std::endl;
        }
    }

    void KvStoreImpl::persist() const {
        if (config_.data_file.empty()) {
            return;
        }
        bool synced = false;
        try {
            synced = storage::write_file_atomically(config_.data_file, data_.dump(2), config_.durable_writes);
        }
        catch (const std::exception& e) {
            std::cerr << "[KvStore] Persist failed: " << e.what() << std::endl;
            throw StorePersistenceError(e.what());
        }
        if (!synced) {
            std::cerr << "[KvStore] Warning: " << config_.data_file
                << " was replaced but its directory could not be fsynced" << std::endl;
        }
    }

    void KvStoreImpl::validate_key(const std::string& key) {
        if (key.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
            throw InvalidKeyError(key, "key must not be empty");
        }
        try {
            json(key).dump();
        }
        catch (const json::type_error& e) {
            throw InvalidKeyError(key, e.what());
        }
    }

    void KvStoreImpl::validate_value(const Value& value) {
        if (value.is_null() || value.is_discarded()) {
            throw InvalidValueError("value must not be null");
        }
        if (!all_numbers_finite(value)) {
            throw SerializationError("non-finite number");
        }
        try {
            value.dump();
        }
        catch (const json::type_error& e) {
            throw SerializationError(e.what());
        }
    }

    json KvStoreImpl::make_metadata(Clock::time_point started) {
        std::chrono::duration<double, std::milli> elapsed = Clock::now() - started;
        json metadata = json::object();
        metadata["thread_id"] = current_thread_id();
        metadata["duration_ms"] = elapsed.count();
        return metadata;
    }

    Value KvStoreImpl::put(const std::string& key, const Value& value) {
        validate_key(key);
        validate_value(value);

        auto started = Clock::now();
        Value old_value(nullptr);
        {
            std::unique_lock<RwLock> lock(lock_);
            auto it = data_.find(key);
            const bool existed = it != data_.end();
            if (existed) {
                old_value = *it;
            }

            data_[key] = value;
            try {
                persist();
            }
            catch (const StorePersistenceError&) {
                if (existed) {
                    data_[key] = old_value;
                }
                else {
                    data_.erase(key);
                }
                throw;
            }
        }

        logger_->log(Operation::PUT, key, value, old_value, make_metadata(started));
        return old_value;
    }

    Value KvStoreImpl::get(const std::string& key) const {
        validate_key(key);

        auto started = Clock::now();
        Value value;
        {
            std::shared_lock<RwLock> lock(lock_);
            auto it = data_.find(key);
            if (it == data_.end()) {
                throw KeyNotFoundError(key);
            }
            value = *it;
        }

        if (config_.log_get_operations) {
            logger_->log(Operation::GET, key, value, Value(nullptr), make_metadata(started));
        }
        return value;
    }

    Value KvStoreImpl::remove(const std::string& key) {
        validate_key(key);

        auto started = Clock::now();
        Value old_value;
        {
            std::unique_lock<RwLock> lock(lock_);
            auto it = data_.find(key);
            if (it == data_.end()) {
                throw KeyNotFoundError(key);
            }

            old_value = *it;
            data_.erase(it);
            try {
                persist();
            }
            catch (const StorePersistenceError&) {
                data_[key] = old_value;
                throw;
            }
        }

        logger_->log(Operation::DELETE, key, Value(nullptr), old_value, make_metadata(started));
        return old_value;
    }

    size_t KvStoreImpl::clear() {
        auto started = Clock::now();
        size_t removed = 0;
        {
            std::unique_lock<RwLock> lock(lock_);
            json previous = json::object();
            previous.swap(data_);
            removed = previous.size();
            try {
                persist();
            }
            catch (const StorePersistenceError&) {
                data_.swap(previous);
                throw;
            }
        }

        if (config_.verbose) {
            std::cout << "[KvStore] Cleared " << removed << " entries" << std::endl;
        }

        json metadata = make_metadata(started);
        metadata["entries_removed"] = removed;
        logger_->log(Operation::CLEAR, std::nullopt, Value(nullptr), Value(nullptr), metadata);
        return removed;
    }

    bool KvStoreImpl::exists(const std::string& key) const {
        validate_key(key);
        std::shared_lock<RwLock> lock(lock_);
        return data_.find(key) != data_.end();
    }

    size_t KvStoreImpl::size() const {
        std::shared_lock<RwLock> lock(lock_);
        return data_.size();
    }

    std::vector<std::string> KvStoreImpl::list_keys() const {
        std::shared_lock<RwLock> lock(lock_);
        std::vector<std::string> keys;
        keys.reserve(data_.size());

        for (auto it = data_.begin(); it != data_.end(); ++it) {
            keys.push_back(it.key());
        }

        return keys;
    }

    std::vector<Value> KvStoreImpl::values() const {
        std::shared_lock<RwLock> lock(lock_);
        std::vector<Value> result;
        result.reserve(data_.size());

        for (const auto& value : data_) {
            result.push_back(value);
        }

        return result;
    }

    std::vector<std::pair<std::string, Value>> KvStoreImpl::items() const {
        std::shared_lock<RwLock> lock(lock_);
        std::vector<std::pair<std::string, Value>> result;
        result.reserve(data_.size());

        for (auto it = data_.begin(); it != data_.end(); ++it) {
            result.emplace_back(it.key(), it.value());
        }

        return result;
    }

    std::shared_ptr<IKvStore> create_kv_store(const StoreConfig& config,
        std::shared_ptr<ITransactionLogger> logger) {
        return std::make_shared<KvStoreImpl>(config, std::move(logger));
    }

}
