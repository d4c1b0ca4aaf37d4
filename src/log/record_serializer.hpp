#pragma once
#include "../../include/kvstore/types.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace kvstore {

    class RecordSerializer {
    public:
        json to_json(const TransactionRecord& record) const;

        // One line of the log file, without the trailing newline.
        std::string serialize(const TransactionRecord& record) const;

        // On failure returns false and describes the problem in `error`.
        bool deserialize(const std::string& data, TransactionRecord& record, std::string& error) const;
        bool from_json(const json& j, TransactionRecord& record, std::string& error) const;
    };

    // 2026-10-17T09:15:02.123456 in local time.
    std::string format_timestamp(std::chrono::system_clock::time_point tp);

}
