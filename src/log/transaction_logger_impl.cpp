#include "transaction_logger_impl.hpp"
#include "../../include/kvstore/exceptions.hpp"
#include "../storage/file_io.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <set>
#include <fcntl.h>
#include <sys/stat.h>

namespace kvstore {

    TransactionLoggerImpl::TransactionLoggerImpl(const LoggerConfig& config)
        : config_(config)
    {
        if (persistent()) {
            load();
            open_for_append();
        }
    }

    void TransactionLoggerImpl::load() {
        std::optional<std::string> content;
        try {
            content = storage::read_file(config_.log_file);
        }
        catch (const std::exception& e) {
            std::cerr << "[TransactionLogger] " << e.what() << std::endl;
            throw LogPersistenceError(e.what());
        }
        if (!content) {
            return;
        }

        size_t line_no = 0;
        size_t pos = 0;
        while (pos < content->size()) {
            size_t end = content->find('\n', pos);
            if (end == std::string::npos) {
                end = content->size();
            }
            std::string line = content->substr(pos, end - pos);
            pos = end + 1;
            ++line_no;

            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            TransactionRecord record;
            std::string error;
            if (!serializer_.deserialize(line, record, error)) {
                std::cerr << "[TransactionLogger] " << config_.log_file << ":" << line_no
                    << ": " << error << std::endl;
                throw CorruptedLogError(config_.log_file, line_no, error);
            }
            if (record.transaction_id <= last_id_) {
                std::string reason = "transaction_id " + std::to_string(record.transaction_id)
                    + " does not follow " + std::to_string(last_id_);
                std::cerr << "[TransactionLogger] " << config_.log_file << ":" << line_no
                    << ": " << reason << std::endl;
                throw CorruptedLogError(config_.log_file, line_no, reason);
            }

            last_id_ = record.transaction_id;
            records_.push_back(std::move(record));
        }

        needs_separator_ = !content->empty() && content->back() != '\n';

        if (config_.verbose) {
            std::cout << "[TransactionLogger] Loaded " << records_.size() << " records from "
                << config_.log_file << " (last id " << last_id_ << ")" << std::endl;
        }
    }

    void TransactionLoggerImpl::open_for_append() {
        try {
            storage::ensure_parent_directory(config_.log_file);
            file_ = storage::FileHandle::open(config_.log_file, O_WRONLY | O_CREAT | O_APPEND);

            struct stat st {};
            if (::fstat(file_.fd(), &st) == 0) {
                file_size_ = static_cast<size_t>(st.st_size);
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[TransactionLogger] " << e.what() << std::endl;
            throw LogPersistenceError(e.what());
        }
    }

    TransactionRecord TransactionLoggerImpl::log(Operation operation,
        const std::optional<std::string>& key,
        const Value& value,
        const Value& old_value,
        const Value& metadata) {
        if (!metadata.is_null() && !metadata.is_object()) {
            throw InvalidValueError("metadata must be a JSON object");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        TransactionRecord record;
        record.transaction_id = last_id_ + 1;
        record.operation = operation;
        record.timestamp = format_timestamp(std::chrono::system_clock::now());
        record.key = key;
        record.value = value;
        record.old_value = old_value;
        record.metadata = metadata.is_object() ? metadata : json::object();

        if (persistent()) {
            std::string line;
            try {
                line = serializer_.serialize(record);
            }
            catch (const json::exception& e) {
                throw SerializationError(e.what());
            }
            if (needs_separator_) {
                line.insert(line.begin(), '\n');
            }
            line.push_back('\n');

            try {
                file_.write_all(line);
                if (config_.durable_writes) {
                    file_.sync();
                }
            }
            catch (const std::exception& e) {
                std::cerr << "[TransactionLogger] Append of transaction "
                    << record.transaction_id << " failed: " << e.what() << std::endl;
                try {
                    file_.truncate(file_size_);
                }
                catch (const std::exception& te) {
                    std::cerr << "[TransactionLogger] Could not drop partial record: "
                        << te.what() << std::endl;
                }
                throw LogPersistenceError(e.what());
            }
            file_size_ += line.size();
            needs_separator_ = false;
        }

        last_id_ = record.transaction_id;
        records_.push_back(record);
        return record;
    }

    std::vector<TransactionRecord> TransactionLoggerImpl::show(
        std::optional<Operation> operation_filter,
        const std::optional<std::string>& key_filter,
        size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<TransactionRecord> matched;
        for (const auto& record : records_) {
            if (operation_filter && record.operation != *operation_filter) {
                continue;
            }
            if (key_filter && record.key != key_filter) {
                continue;
            }
            matched.push_back(record);
        }

        if (limit > 0 && matched.size() > limit) {
            matched.erase(matched.begin(), matched.end() - static_cast<std::ptrdiff_t>(limit));
        }
        return matched;
    }

    LogStats TransactionLoggerImpl::stats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LogStats stats;
        stats.total = records_.size();
        for (Operation op : { Operation::PUT, Operation::GET, Operation::DELETE, Operation::CLEAR }) {
            stats.per_operation[operation_to_string(op)] = 0;
        }

        std::set<std::string> keys;
        double duration_sum = 0.0;
        uint64_t duration_count = 0;

        for (const auto& record : records_) {
            stats.per_operation[operation_to_string(record.operation)]++;
            if (record.key) {
                keys.insert(*record.key);
            }

            auto it = record.metadata.find("duration_ms");
            if (it == record.metadata.end() || !it->is_number()) {
                continue;
            }
            double duration = it->get<double>();
            stats.min_duration_ms = stats.min_duration_ms ? std::min(*stats.min_duration_ms, duration) : duration;
            stats.max_duration_ms = stats.max_duration_ms ? std::max(*stats.max_duration_ms, duration) : duration;
            duration_sum += duration;
            duration_count++;
        }

        stats.distinct_keys = keys.size();
        if (duration_count > 0) {
            stats.avg_duration_ms = duration_sum / static_cast<double>(duration_count);
        }
        return stats;
    }

    size_t TransactionLoggerImpl::clear_log() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (persistent()) {
            try {
                file_.truncate(0);
                if (config_.durable_writes) {
                    file_.sync();
                }
            }
            catch (const std::exception& e) {
                std::cerr << "[TransactionLogger] Clear failed: " << e.what() << std::endl;
                throw LogPersistenceError(e.what());
            }
            file_size_ = 0;
            needs_separator_ = false;
        }

        size_t removed = records_.size();
        records_.clear();
        last_id_ = 0;

        if (config_.verbose) {
            std::cout << "[TransactionLogger] Cleared " << removed << " records" << std::endl;
        }
        return removed;
    }

    size_t TransactionLoggerImpl::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    uint64_t TransactionLoggerImpl::last_transaction_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_id_;
    }

    std::shared_ptr<ITransactionLogger> create_transaction_logger(const LoggerConfig& config) {
        return std::make_shared<TransactionLoggerImpl>(config);
    }

}
