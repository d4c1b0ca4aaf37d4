#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace kvstore {

    using json = nlohmann::json;
    using Value = nlohmann::json;

    enum class Operation : uint8_t {
        PUT = 1,
        GET = 2,
        DELETE = 3,
        CLEAR = 4
    };

    inline std::string operation_to_string(Operation op) {
        switch (op) {
        case Operation::PUT: return "PUT";
        case Operation::GET: return "GET";
        case Operation::DELETE: return "DELETE";
        case Operation::CLEAR: return "CLEAR";
        default: return "UNKNOWN";
        }
    }

    // Strict: unknown names yield nullopt instead of a default operation.
    inline std::optional<Operation> string_to_operation(const std::string& str) {
        if (str == "PUT") return Operation::PUT;
        if (str == "GET") return Operation::GET;
        if (str == "DELETE") return Operation::DELETE;
        if (str == "CLEAR") return Operation::CLEAR;
        return std::nullopt;
    }

    struct TransactionRecord {
        uint64_t transaction_id;
        Operation operation;
        std::string timestamp;          // local ISO-8601, microseconds
        std::optional<std::string> key; // empty for CLEAR
        Value value;                    // null when not applicable
        Value old_value;                // null when nothing was displaced
        Value metadata;                 // JSON object

        TransactionRecord()
            : transaction_id(0), operation(Operation::PUT),
            value(nullptr), old_value(nullptr), metadata(json::object()) {
        }
    };

    struct LogStats {
        uint64_t total = 0;
        std::map<std::string, uint64_t> per_operation;
        uint64_t distinct_keys = 0;
        std::optional<double> min_duration_ms;
        std::optional<double> max_duration_ms;
        std::optional<double> avg_duration_ms;
    };

    struct StoreConfig {
        std::string data_file;            // empty = in-memory only
        bool log_get_operations = false;
        bool durable_writes = true;
        bool verbose = false;
    };

    struct LoggerConfig {
        std::string log_file;             // empty = in-memory only
        bool durable_writes = true;
        bool verbose = false;
    };

}
