#include "record_serializer.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kvstore {

    json RecordSerializer::to_json(const TransactionRecord& record) const {
        json j;
        j["transaction_id"] = record.transaction_id;
        j["operation"] = operation_to_string(record.operation);
        j["timestamp"] = record.timestamp;
        j["key"] = record.key ? json(*record.key) : json(nullptr);
        j["value"] = record.value;
        j["old_value"] = record.old_value;
        j["metadata"] = record.metadata.is_object() ? record.metadata : json::object();
        return j;
    }

    std::string RecordSerializer::serialize(const TransactionRecord& record) const {
        return to_json(record).dump();
    }

    bool RecordSerializer::deserialize(const std::string& data, TransactionRecord& record,
        std::string& error) const {
        json j = json::parse(data, nullptr, false);
        if (j.is_discarded()) {
            error = "invalid JSON";
            return false;
        }
        return from_json(j, record, error);
    }

    bool RecordSerializer::from_json(const json& j, TransactionRecord& record, std::string& error) const {
        if (!j.is_object()) {
            error = "record is not a JSON object";
            return false;
        }

        auto id = j.find("transaction_id");
        if (id == j.end() || !id->is_number_unsigned()) {
            error = "missing or invalid transaction_id";
            return false;
        }

        auto op = j.find("operation");
        if (op == j.end() || !op->is_string()) {
            error = "missing operation";
            return false;
        }
        auto parsed_op = string_to_operation(op->get<std::string>());
        if (!parsed_op) {
            error = "unknown operation '" + op->get<std::string>() + "'";
            return false;
        }

        auto ts = j.find("timestamp");
        if (ts == j.end() || !ts->is_string()) {
            error = "missing timestamp";
            return false;
        }

        auto key = j.find("key");
        if (key != j.end() && !key->is_null() && !key->is_string()) {
            error = "key must be a string or null";
            return false;
        }

        auto metadata = j.find("metadata");
        if (metadata != j.end() && !metadata->is_null() && !metadata->is_object()) {
            error = "metadata must be an object";
            return false;
        }

        record.transaction_id = id->get<uint64_t>();
        record.operation = *parsed_op;
        record.timestamp = ts->get<std::string>();
        record.key = (key != j.end() && key->is_string())
            ? std::optional<std::string>(key->get<std::string>())
            : std::nullopt;
        record.value = j.value("value", json(nullptr));
        record.old_value = j.value("old_value", json(nullptr));
        record.metadata = (metadata != j.end() && metadata->is_object()) ? *metadata : json::object();
        return true;
    }

    std::string format_timestamp(std::chrono::system_clock::time_point tp) {
        using namespace std::chrono;

        std::time_t seconds = system_clock::to_time_t(tp);
        auto micros = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
        if (micros < 0) {
            micros += 1000000;
        }

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(6) << std::setfill('0') << micros;
        return out.str();
    }

}
