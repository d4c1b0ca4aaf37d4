#pragma once
#include "types.hpp"
#include "transaction_logger.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kvstore {

    class IKvStore {
    public:
        virtual ~IKvStore() = default;

        // Returns the displaced value, or null if the key was new.
        virtual Value put(const std::string& key, const Value& value) = 0;
        virtual Value get(const std::string& key) const = 0;
        // Returns the removed value. Throws KeyNotFoundError if absent.
        virtual Value remove(const std::string& key) = 0;
        // Returns the number of entries removed.
        virtual size_t clear() = 0;

        virtual bool exists(const std::string& key) const = 0;
        virtual size_t size() const = 0;

        // Snapshots, sorted by key.
        virtual std::vector<std::string> list_keys() const = 0;
        virtual std::vector<Value> values() const = 0;
        virtual std::vector<std::pair<std::string, Value>> items() const = 0;

        virtual std::shared_ptr<ITransactionLogger> logger() const = 0;
    };

    // Loads config.data_file if present. Throws CorruptedStoreError on bad contents.
    std::shared_ptr<IKvStore> create_kv_store(const StoreConfig& config,
        std::shared_ptr<ITransactionLogger> logger);

}
