// tests/test_registry.cpp
#include <chrono>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/core/CacheRegistry.hpp"
#include "../src/core/ExpirationExecutor.hpp"
#include "../src/logging/ConsoleLogger.hpp"
#include "TestHelpers.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::NiceMock;

using StringRegistry = CacheRegistry<std::string, std::string>;

class CacheRegistryTest : public ::testing::Test {
protected:
    std::ostringstream log_out;
    std::ostringstream log_err;
    std::shared_ptr<ConsoleLogger> logger;
    std::unique_ptr<ExpirationExecutor> executor;
    CacheConfig config;

    void SetUp() override {
        logger = std::make_shared<ConsoleLogger>(LogUtils::LogLevel::CERROR, log_out, log_err);
        executor = std::make_unique<ExpirationExecutor>(config, logger);
    }

    void TearDown() override {
        executor->shutdown();
    }
};

TEST_F(CacheRegistryTest, SameNameReturnsSameTable) {
    StringRegistry registry(executor->context(), config);
    EXPECT_FALSE(registry.hasTable("users"));

    auto first = registry.getOrCreateTable("users");
    auto second = registry.getOrCreateTable("users");
    auto other = registry.getOrCreateTable("sessions");

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_EQ(first->name(), "users");
    EXPECT_TRUE(registry.hasTable("users"));
    EXPECT_EQ(registry.tableCount(), 2u);

    first->add("k", 0ms, "v");
    EXPECT_TRUE(second->exists("k"));
    EXPECT_FALSE(other->exists("k"));
}

TEST_F(CacheRegistryTest, ConcurrentFirstAccessCreatesOneTable) {
    StringRegistry registry(executor->context(), config);
    const int threads = 8;
    std::vector<std::shared_ptr<StringRegistry::Table>> results(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&registry, &results, t]() {
            results[t] = registry.getOrCreateTable("shared");
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<StringRegistry::Table*> distinct;
    for (const auto& table : results) {
        distinct.insert(table.get());
    }
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(registry.tableCount(), 1u);
}

TEST_F(CacheRegistryTest, TablesExpireOnRegistryContext) {
    StringRegistry registry(executor->context(), config);
    auto table = registry.getOrCreateTable("ttl");
    table->add("a", 50ms, "1");

    EXPECT_TRUE(waitUntil([&table]() { return !table->exists("a"); }, 2s));
}

TEST_F(CacheRegistryTest, TablesStartSilentByDefault) {
    auto mock_logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*mock_logger, debug(HasSubstr("Created cache table quiet"))).Times(1);
    EXPECT_CALL(*mock_logger, debug(HasSubstr("Adding item"))).Times(0);

    StringRegistry registry(executor->context(), config, mock_logger);
    registry.getOrCreateTable("quiet")->add("a", 0ms, "1");
}

TEST_F(CacheRegistryTest, AttachesLoggerWhenConfigured) {
    auto mock_logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*mock_logger, debug(HasSubstr("Created cache table chatty"))).Times(1);
    EXPECT_CALL(*mock_logger, debug(HasSubstr("Adding item with key a"))).Times(1);

    config.attach_logger_to_tables = true;
    StringRegistry registry(executor->context(), config, mock_logger);
    registry.getOrCreateTable("chatty")->add("a", 0ms, "1");
}
