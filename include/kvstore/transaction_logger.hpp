#pragma once
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kvstore {

    /*
     * Append-only audit trail of store operations.
     * Ids are assigned at append time and strictly increase with file order.
     */
    class ITransactionLogger {
    public:
        virtual ~ITransactionLogger() = default;

        // Throws LogPersistenceError if the record cannot be written.
        virtual TransactionRecord log(Operation operation,
            const std::optional<std::string>& key,
            const Value& value,
            const Value& old_value,
            const Value& metadata) = 0;

        // Filter first, then keep the last `limit` matches (0 = all).
        virtual std::vector<TransactionRecord> show(
            std::optional<Operation> operation_filter = std::nullopt,
            const std::optional<std::string>& key_filter = std::nullopt,
            size_t limit = 0) const = 0;

        virtual LogStats stats() const = 0;
        virtual size_t clear_log() = 0;

        virtual size_t size() const = 0;
        virtual uint64_t last_transaction_id() const = 0;
    };

    // Throws CorruptedLogError if an existing log file is malformed.
    std::shared_ptr<ITransactionLogger> create_transaction_logger(const LoggerConfig& config);

}
