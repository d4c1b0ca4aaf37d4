#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../include/kvstore.hpp"
#include "cli/command_line.hpp"

using namespace kvstore;

namespace {

    struct Options {
        StoreConfig store;
        LoggerConfig logger;
        std::string command;
        std::vector<std::string> args;
        bool help = false;
    };

    void print_usage(const char* argv0) {
        std::cout << "Usage: " << argv0 << " [options] [--command <name> [args...]]\n"
            << "\n"
            << "  --data-file <path>   data file (default: kv_store_data.json)\n"
            << "  --log-file <path>    transaction log (default: kv_store_log.json)\n"
            << "  --log-gets           record GET operations in the log\n"
            << "  --no-fsync           skip fsync on writes\n"
            << "  --verbose            print diagnostics\n"
            << "  --command <name>     run one command and exit\n"
            << "  --help               show this help\n"
            << "\n"
            << "Without --command an interactive prompt is started." << std::endl;
    }

    bool parse_options(int argc, char** argv, Options& opts) {
        opts.store.data_file = "kv_store_data.json";
        opts.logger.log_file = "kv_store_log.json";

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&](std::string& target) {
                if (i + 1 >= argc) {
                    std::cerr << "[CLI] Missing value for " << arg << std::endl;
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--data-file") {
                if (!next(opts.store.data_file)) return false;
            }
            else if (arg == "--log-file") {
                if (!next(opts.logger.log_file)) return false;
            }
            else if (arg == "--log-gets") {
                opts.store.log_get_operations = true;
            }
            else if (arg == "--no-fsync") {
                opts.store.durable_writes = false;
                opts.logger.durable_writes = false;
            }
            else if (arg == "--verbose") {
                opts.store.verbose = true;
                opts.logger.verbose = true;
            }
            else if (arg == "--help" || arg == "-h") {
                opts.help = true;
            }
            else if (arg == "--command") {
                if (!next(opts.command)) return false;
                for (++i; i < argc; i++) {
                    opts.args.push_back(argv[i]);
                }
            }
            else {
                std::cerr << "[CLI] Unknown option: " << arg << std::endl;
                return false;
            }
        }
        return true;
    }

}

int main(int argc, char** argv) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        auto logger = create_transaction_logger(opts.logger);
        auto store = create_kv_store(opts.store, logger);
        cli::CommandLine cli(store);

        if (!opts.command.empty()) {
            return cli.execute(opts.command, opts.args) ? 0 : 1;
        }

        cli.run(std::cin);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
