#pragma once
#include "../../include/kvstore/store.hpp"
#include "rw_lock.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace kvstore {

    class KvStoreImpl : public IKvStore {
    public:
        KvStoreImpl(const StoreConfig& config, std::shared_ptr<ITransactionLogger> logger);

        Value put(const std::string& key, const Value& value) override;
        Value get(const std::string& key) const override;
        Value remove(const std::string& key) override;
        size_t clear() override;

        bool exists(const std::string& key) const override;
        size_t size() const override;

        std::vector<std::string> list_keys() const override;
        std::vector<Value> values() const override;
        std::vector<std::pair<std::string, Value>> items() const override;

        std::shared_ptr<ITransactionLogger> logger() const override { return logger_; }

    private:
        using Clock = std::chrono::steady_clock;

        static void validate_key(const std::string& key);
        static void validate_value(const Value& value);
        static json make_metadata(Clock::time_point started);

        void load();
        // Caller holds the write lock. Throws StorePersistenceError.
        void persist() const;

        StoreConfig config_;
        std::shared_ptr<ITransactionLogger> logger_;

        json data_;  // always an object; sorted by key
        mutable RwLock lock_;
    };

}
