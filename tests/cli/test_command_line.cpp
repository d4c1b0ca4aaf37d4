#include <gtest/gtest.h>
#include "cli/command_line.hpp"
#include "kvstore.hpp"
#include "test_util.hpp"

#include <sstream>

using namespace kvstore;

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        StoreConfig store_config;
        store_config.data_file = dir.file("data.json");
        store_config.durable_writes = false;

        LoggerConfig logger_config;
        logger_config.log_file = dir.file("log.json");
        logger_config.durable_writes = false;

        store = create_kv_store(store_config, create_transaction_logger(logger_config));
        shell = std::make_unique<cli::CommandLine>(store, out, err);
    }

    void reset_output() {
        out.str("");
        err.str("");
    }

    test::TempDir dir;
    std::ostringstream out;
    std::ostringstream err;
    std::shared_ptr<IKvStore> store;
    std::unique_ptr<cli::CommandLine> shell;
};

TEST_F(CommandLineTest, PutParsesJsonValues) {
    EXPECT_TRUE(shell->execute("put", { "n", "42" }));
    EXPECT_TRUE(shell->execute("put", { "s", "hello" }));
    EXPECT_TRUE(shell->execute_line(R"(put obj {"a": [1, 2]})"));

    EXPECT_EQ(store->get("n"), 42);
    EXPECT_EQ(store->get("s"), "hello");
    EXPECT_EQ(store->get("obj")["a"][1], 2);
}

TEST_F(CommandLineTest, PutKeepsValueSpacing) {
    EXPECT_TRUE(shell->execute_line("put greeting   hello   big  world  "));
    EXPECT_EQ(store->get("greeting"), "hello   big  world");

    EXPECT_TRUE(shell->execute_line("set note \"two  spaces\""));
    EXPECT_EQ(store->get("note"), "two  spaces");

    EXPECT_FALSE(shell->execute_line("put lonely   "));
    EXPECT_FALSE(store->exists("lonely"));
}

TEST_F(CommandLineTest, PutStoresNullTextAsString) {
    EXPECT_TRUE(shell->execute_line("put k null"));
    EXPECT_EQ(store->get("k"), "null");

    EXPECT_TRUE(shell->execute("put", { "k2", "null" }));
    EXPECT_EQ(store->get("k2"), "null");
}

TEST_F(CommandLineTest, PutReportsPreviousValue) {
    shell->execute("put", { "a", "1" });
    reset_output();
    shell->execute("put", { "a", "2" });
    EXPECT_EQ(out.str(), "PUT a = 2 (was 1)\n");
}

TEST_F(CommandLineTest, GetPrintsValue) {
    store->put("user:1", "Ivan Petrov");
    EXPECT_TRUE(shell->execute("get", { "user:1" }));
    EXPECT_EQ(out.str(), "\"Ivan Petrov\"\n");
}

TEST_F(CommandLineTest, GetMissingKeyFails) {
    EXPECT_FALSE(shell->execute("get", { "missing" }));
    EXPECT_NE(err.str().find("not found"), std::string::npos);
}

TEST_F(CommandLineTest, DeleteRemovesKey) {
    store->put("k", "v");
    EXPECT_TRUE(shell->execute("delete", { "k" }));
    EXPECT_FALSE(store->exists("k"));
    EXPECT_FALSE(shell->execute("delete", { "k" }));
}

TEST_F(CommandLineTest, ListAndSize) {
    EXPECT_TRUE(shell->execute("list", {}));
    EXPECT_EQ(out.str(), "Store is empty\n");

    store->put("b", 2);
    store->put("a", "x");
    reset_output();
    EXPECT_TRUE(shell->execute("list", {}));
    EXPECT_EQ(out.str(), "Keys: 2\n  a: x\n  b: 2\n");

    reset_output();
    EXPECT_TRUE(shell->execute("size", {}));
    EXPECT_EQ(out.str(), "2\n");
}

TEST_F(CommandLineTest, ClearReportsRemovedCount) {
    store->put("a", 1);
    store->put("b", 2);
    EXPECT_TRUE(shell->execute("clear", {}));
    EXPECT_EQ(out.str(), "Store cleared (2 entries removed)\n");
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(CommandLineTest, LogShowFiltersAndLimits) {
    store->put("a", "1");
    store->put("a", "2");
    store->put("b", "3");

    EXPECT_TRUE(shell->execute("log", { "show", "put", "a" }));
    EXPECT_NE(out.str().find("Transactions: 2"), std::string::npos);

    reset_output();
    EXPECT_TRUE(shell->execute("log", { "show", "-", "-", "1" }));
    EXPECT_NE(out.str().find("Transactions: 1"), std::string::npos);
    EXPECT_NE(out.str().find("\"b\""), std::string::npos);

    EXPECT_FALSE(shell->execute("log", { "show", "MERGE" }));
    EXPECT_FALSE(shell->execute("log", { "show", "PUT", "a", "many" }));
}

TEST_F(CommandLineTest, LogStatsReportsCounts) {
    store->put("a", 1);
    store->put("b", 2);
    store->put("c", 3);
    store->remove("a");

    EXPECT_TRUE(shell->execute("log", { "stats" }));
    json stats = json::parse(out.str());
    EXPECT_EQ(stats["total_transactions"], 4);
    EXPECT_EQ(stats["operations"]["PUT"], 3);
    EXPECT_EQ(stats["operations"]["DELETE"], 1);
    EXPECT_EQ(stats["store_size"], 2);
}

TEST_F(CommandLineTest, LogClearEmptiesLog) {
    store->put("a", 1);
    EXPECT_TRUE(shell->execute("log", { "clear" }));
    EXPECT_EQ(store->logger()->size(), 0u);

    reset_output();
    shell->execute("log", { "show" });
    EXPECT_EQ(out.str(), "Transaction log is empty\n");
}

TEST_F(CommandLineTest, UsageErrors) {
    EXPECT_FALSE(shell->execute("put", { "only-key" }));
    EXPECT_FALSE(shell->execute("get", {}));
    EXPECT_FALSE(shell->execute("log", {}));
    EXPECT_FALSE(shell->execute("frobnicate", {}));
    EXPECT_FALSE(shell->execute("put", { " ", "v" }));
}

TEST_F(CommandLineTest, InteractiveSessionStopsOnExit) {
    std::istringstream in("put a 1\nget a\n\nexit\nput b 2\n");
    shell->run(in);

    EXPECT_EQ(store->get("a"), 1);
    EXPECT_FALSE(store->exists("b"));
    EXPECT_NE(out.str().find("Bye!"), std::string::npos);
}
