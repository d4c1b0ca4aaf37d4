#pragma once
#include "../../include/kvstore/store.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace kvstore::cli {

    /*
     * Text front end over a store and its transaction log.
     * execute() returns false when the command reported an error.
     */
    class CommandLine {
    public:
        explicit CommandLine(std::shared_ptr<IKvStore> store,
            std::ostream& out = std::cout,
            std::ostream& err = std::cerr);

        bool execute(const std::string& command, const std::vector<std::string>& args);
        bool execute_line(const std::string& line);

        // Reads commands until exit/quit/q or end of input.
        void run(std::istream& in);

        void print_help() const;

    private:
        bool cmd_put(const std::vector<std::string>& args);
        bool cmd_get(const std::vector<std::string>& args);
        bool cmd_delete(const std::vector<std::string>& args);
        bool cmd_exists(const std::vector<std::string>& args);
        bool cmd_list();
        bool cmd_size();
        bool cmd_clear();
        bool cmd_log(const std::vector<std::string>& args);

        bool log_show(const std::vector<std::string>& args);
        bool log_stats();
        bool log_clear();

        bool fail(const std::string& message) const;

        std::shared_ptr<IKvStore> store_;
        std::ostream& out_;
        std::ostream& err_;
    };

}
