#include "command_line.hpp"
#include "../../include/kvstore/exceptions.hpp"
#include "../log/record_serializer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace kvstore::cli {

    namespace {

        std::string to_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return s;
        }

        std::string to_upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return s;
        }

        // JSON if it parses to a non-null value, the raw text otherwise.
        Value parse_value(const std::string& text) {
            json parsed = json::parse(text, nullptr, false);
            if (parsed.is_discarded() || parsed.is_null()) {
                return Value(text);
            }
            return parsed;
        }

        std::string render(const Value& value) {
            return value.is_string() ? value.get<std::string>() : value.dump();
        }

    }

    CommandLine::CommandLine(std::shared_ptr<IKvStore> store, std::ostream& out, std::ostream& err)
        : store_(std::move(store))
        , out_(out)
        , err_(err)
    {
    }

    bool CommandLine::fail(const std::string& message) const {
        err_ << "Error: " << message << std::endl;
        return false;
    }

    bool CommandLine::execute_line(const std::string& line) {
        std::istringstream iss(line);
        std::string command;
        if (!(iss >> command)) {
            return true;
        }

        std::vector<std::string> args;
        const std::string cmd = to_lower(command);
        if (cmd == "put" || cmd == "set") {
            // Everything after the key is the value, spacing included.
            std::string key;
            std::string rest;
            if (iss >> key) {
                args.push_back(key);
                std::getline(iss, rest);
                size_t begin = rest.find_first_not_of(" \t\r");
                size_t end = rest.find_last_not_of(" \t\r");
                if (begin != std::string::npos) {
                    args.push_back(rest.substr(begin, end - begin + 1));
                }
            }
            return execute(command, args);
        }

        std::string token;
        while (iss >> token) {
            args.push_back(token);
        }
        return execute(command, args);
    }

    bool CommandLine::execute(const std::string& command, const std::vector<std::string>& args) {
        const std::string cmd = to_lower(command);
        try {
            if (cmd == "put" || cmd == "set") return cmd_put(args);
            if (cmd == "get") return cmd_get(args);
            if (cmd == "delete" || cmd == "del") return cmd_delete(args);
            if (cmd == "exists") return cmd_exists(args);
            if (cmd == "list") return cmd_list();
            if (cmd == "size") return cmd_size();
            if (cmd == "clear") return cmd_clear();
            if (cmd == "log") return cmd_log(args);
            if (cmd == "help" || cmd == "?") {
                print_help();
                return true;
            }
        }
        catch (const KvStoreError& e) {
            return fail(e.what());
        }

        fail("unknown command '" + command + "'");
        print_help();
        return false;
    }

    bool CommandLine::cmd_put(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            return fail("usage: put <key> <value>");
        }

        std::string text = args[1];
        for (size_t i = 2; i < args.size(); ++i) {
            text += " " + args[i];
        }

        Value value = parse_value(text);
        Value old_value = store_->put(args[0], value);
        out_ << "PUT " << args[0] << " = " << render(value);
        if (!old_value.is_null()) {
            out_ << " (was " << render(old_value) << ")";
        }
        out_ << std::endl;
        return true;
    }

    bool CommandLine::cmd_get(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            return fail("usage: get <key>");
        }
        out_ << store_->get(args[0]).dump(2) << std::endl;
        return true;
    }

    bool CommandLine::cmd_delete(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            return fail("usage: delete <key>");
        }
        Value old_value = store_->remove(args[0]);
        out_ << "DELETED " << args[0] << " = " << render(old_value) << std::endl;
        return true;
    }

    bool CommandLine::cmd_exists(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            return fail("usage: exists <key>");
        }
        out_ << (store_->exists(args[0]) ? "true" : "false") << std::endl;
        return true;
    }

    bool CommandLine::cmd_list() {
        auto items = store_->items();
        if (items.empty()) {
            out_ << "Store is empty" << std::endl;
            return true;
        }

        out_ << "Keys: " << items.size() << std::endl;
        for (const auto& [key, value] : items) {
            out_ << "  " << key << ": " << render(value) << std::endl;
        }
        return true;
    }

    bool CommandLine::cmd_size() {
        out_ << store_->size() << std::endl;
        return true;
    }

    bool CommandLine::cmd_clear() {
        size_t removed = store_->clear();
        out_ << "Store cleared (" << removed << " entries removed)" << std::endl;
        return true;
    }

    bool CommandLine::cmd_log(const std::vector<std::string>& args) {
        if (args.empty()) {
            return fail("usage: log show|stats|clear");
        }

        const std::string sub = to_lower(args[0]);
        std::vector<std::string> rest(args.begin() + 1, args.end());
        if (sub == "show") return log_show(rest);
        if (sub == "stats") return log_stats();
        if (sub == "clear") return log_clear();
        return fail("unknown log command '" + args[0] + "'");
    }

    bool CommandLine::log_show(const std::vector<std::string>& args) {
        std::optional<Operation> operation;
        std::optional<std::string> key;
        size_t limit = 0;

        if (args.size() > 0 && args[0] != "-") {
            operation = string_to_operation(to_upper(args[0]));
            if (!operation) {
                return fail("unknown operation '" + args[0] + "'");
            }
        }
        if (args.size() > 1 && args[1] != "-") {
            key = args[1];
        }
        if (args.size() > 2) {
            try {
                size_t consumed = 0;
                limit = std::stoul(args[2], &consumed);
                if (consumed != args[2].size()) {
                    return fail("invalid limit '" + args[2] + "'");
                }
            }
            catch (const std::logic_error&) {
                return fail("invalid limit '" + args[2] + "'");
            }
        }

        auto records = store_->logger()->show(operation, key, limit);
        if (records.empty()) {
            out_ << "Transaction log is empty" << std::endl;
            return true;
        }

        RecordSerializer serializer;
        json list = json::array();
        for (const auto& record : records) {
            list.push_back(serializer.to_json(record));
        }
        out_ << "Transactions: " << records.size() << std::endl;
        out_ << list.dump(2) << std::endl;
        return true;
    }

    bool CommandLine::log_stats() {
        LogStats stats = store_->logger()->stats();

        json j;
        j["total_transactions"] = stats.total;
        j["store_size"] = store_->size();
        j["operations"] = stats.per_operation;
        j["distinct_keys"] = stats.distinct_keys;
        j["min_duration_ms"] = stats.min_duration_ms ? json(*stats.min_duration_ms) : json(nullptr);
        j["max_duration_ms"] = stats.max_duration_ms ? json(*stats.max_duration_ms) : json(nullptr);
        j["avg_duration_ms"] = stats.avg_duration_ms ? json(*stats.avg_duration_ms) : json(nullptr);
        out_ << j.dump(2) << std::endl;
        return true;
    }

    bool CommandLine::log_clear() {
        size_t removed = store_->logger()->clear_log();
        out_ << "Transaction log cleared (" << removed << " records removed)" << std::endl;
        return true;
    }

    void CommandLine::run(std::istream& in) {
        out_ << "KV-Store CLI - interactive mode" << std::endl;
        out_ << "Type 'help' for commands, 'exit' to quit" << std::endl;

        std::string input;
        while (true) {
            out_ << "kv-store> " << std::flush;
            if (!std::getline(in, input)) break;

            std::istringstream iss(input);
            std::string first;
            if (!(iss >> first)) continue;

            const std::string cmd = to_lower(first);
            if (cmd == "exit" || cmd == "quit" || cmd == "q") {
                break;
            }
            execute_line(input);
        }
        out_ << "Bye!" << std::endl;
    }

    void CommandLine::print_help() const {
        out_ << "\nAVAILABLE COMMANDS:" << std::endl;
        out_ << "------------------------" << std::endl;
        out_ << "put <key> <value>              - Store a value (parsed as JSON when possible)" << std::endl;
        out_ << "get <key>                      - Print the value of a key" << std::endl;
        out_ << "delete <key>                   - Remove a key" << std::endl;
        out_ << "exists <key>                   - Check whether a key is present" << std::endl;
        out_ << "list                           - Show all keys and values" << std::endl;
        out_ << "size                           - Number of stored keys" << std::endl;
        out_ << "clear                          - Remove every key" << std::endl;
        out_ << "log show [op] [key] [limit]    - Show transactions ('-' skips a filter)" << std::endl;
        out_ << "log stats                      - Transaction statistics" << std::endl;
        out_ << "log clear                      - Truncate the transaction log" << std::endl;
        out_ << "help                           - Show this help" << std::endl;
        out_ << "exit                           - Exit program" << std::endl;
    }

}
