#pragma once
#include "../../include/kvstore/transaction_logger.hpp"
#include "../storage/file_handle.hpp"
#include "record_serializer.hpp"
#include <mutex>
#include <vector>

namespace kvstore {

    class TransactionLoggerImpl : public ITransactionLogger {
    public:
        explicit TransactionLoggerImpl(const LoggerConfig& config);

        TransactionRecord log(Operation operation,
            const std::optional<std::string>& key,
            const Value& value,
            const Value& old_value,
            const Value& metadata) override;

        std::vector<TransactionRecord> show(
            std::optional<Operation> operation_filter = std::nullopt,
            const std::optional<std::string>& key_filter = std::nullopt,
            size_t limit = 0) const override;

        LogStats stats() const override;
        size_t clear_log() override;

        size_t size() const override;
        uint64_t last_transaction_id() const override;

    private:
        bool persistent() const { return !config_.log_file.empty(); }

        void load();
        void open_for_append();

        LoggerConfig config_;
        RecordSerializer serializer_;

        mutable std::mutex mutex_;
        std::vector<TransactionRecord> records_;
        uint64_t last_id_ = 0;
        storage::FileHandle file_;
        size_t file_size_ = 0;
        bool needs_separator_ = false; // existing file lacks a trailing newline
    };

}
