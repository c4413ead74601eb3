// TALLY - Utility Tests
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Tests for logging, the thread pool, JSON and base64url utilities.

#include <gtest/gtest.h>

#include "tally/util/base64.h"
#include "tally/util/json.h"
#include "tally/util/logging.h"
#include "tally/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace tally {
namespace util {
namespace test {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(entry);
        }, LogLevel::Trace);
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::vector<LogEntry> Entries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::shared_ptr<CallbackSink> sink_;
    std::mutex mutex_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LevelRoundTrip) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARN"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("nonsense"), LogLevel::Info);
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, StreamMacroDeliversMessage) {
    LOG_INFO(LogCategory::LEDGER) << "recorded " << 3 << " transactions";

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].category, LogCategory::LEDGER);
    EXPECT_EQ(entries[0].message, "recorded 3 transactions");
}

TEST_F(LoggingTest, LevelFilterDropsLowerLevels) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::DEFAULT) << "hidden";
    LOG_WARN(LogCategory::DEFAULT) << "shown";

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "shown");
}

TEST_F(LoggingTest, CategoryRestriction) {
    Logger::Instance().EnableCategory(LogCategory::ALLOC);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::ALLOC));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));

    LOG_INFO(LogCategory::DB) << "filtered";
    LOG_INFO(LogCategory::ALLOC) << "kept";

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, LogCategory::ALLOC);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::RECON;
    entry.message = "discrepancy";
    entry.timestamp = std::chrono::system_clock::now();

    LogFormat format;
    format.showTimestamp = false;
    std::string line = FormatLogEntry(entry, format);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("recon"), std::string::npos);
    EXPECT_NE(line.find("discrepancy"), std::string::npos);
}

TEST_F(LoggingTest, FileSinkAppendsLines) {
    auto path = std::filesystem::temp_directory_path() / "tally_logging_test.log";
    std::filesystem::remove(path);
    {
        FileSink::Config config;
        config.path = path.string();
        config.format.showTimestamp = false;
        config.format.showThread = false;
        auto file = std::make_shared<FileSink>(config);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);

        LOG_DEBUG(LogCategory::DB) << "first";
        LOG_ERROR(LogCategory::DB) << "second";
        Logger::Instance().ClearSinks();
    }

    std::ifstream in(path);
    std::string first, second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_EQ(first, "[DEBUG] [db] first");
    EXPECT_EQ(second, "[ERROR] [db] second");
    in.close();
    std::filesystem::remove(path);
}

// ============================================================================
// Thread Pool Tests
// ============================================================================

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto future = pool.Submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, ExceptionsTravelThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitDrainsQueue) {
    ThreadPool::Config config;
    config.numThreads = 4;
    config.name = "test";
    ThreadPool pool(config);
    EXPECT_EQ(pool.ThreadCount(), 4u);
    EXPECT_EQ(pool.Name(), "test");

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.Execute([&counter]() { counter.fetch_add(1); });
    }
    pool.Wait();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, BoundedQueueRejects) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    ThreadPool pool(config);

    std::atomic<bool> release{false};
    pool.Execute([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    // Let the worker pick up the blocking task
    while (pool.ActiveTasks() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(pool.TrySubmit([]() {}));
    EXPECT_FALSE(pool.TrySubmit([]() {}));
    EXPECT_THROW(pool.Execute([]() {}), std::runtime_error);

    release.store(true);
    pool.Wait();
}

TEST(ThreadPoolTest, StoppedPoolRejects) {
    ThreadPool pool(1);
    pool.Stop();
    EXPECT_FALSE(pool.IsRunning());
    EXPECT_FALSE(pool.TrySubmit([]() {}));
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST(JSONTest, ParseObject) {
    auto value = JSONValue::Parse(
        R"({"amount":"100.00","count":3,"ok":true,"none":null,"list":[1,2]})");
    ASSERT_TRUE(value.IsObject());
    EXPECT_EQ(value["amount"].GetString(), "100.00");
    EXPECT_EQ(value["count"].GetInt(), 3);
    EXPECT_TRUE(value["ok"].GetBool());
    EXPECT_TRUE(value["none"].IsNull());
    EXPECT_EQ(value["list"].Size(), 2u);
    EXPECT_TRUE(value["missing"].IsNull());
}

TEST(JSONTest, NumberLiteralIsRetained) {
    auto value = JSONValue::Parse(R"({"amount":100.10,"big":12345678901234567})");
    EXPECT_TRUE(value["amount"].IsDouble());
    EXPECT_EQ(value["amount"].GetNumberText(), "100.10");
    EXPECT_EQ(value["big"].GetNumberText(), "12345678901234567");
    EXPECT_EQ(JSONValue(int64_t(42)).GetNumberText(), "42");
}

TEST(JSONTest, SerializeEscapesStrings) {
    JSONValue value(JSONValue::Object{});
    value["text"] = "quote \" and \\ and\nnewline";
    std::string json = value.ToJSON();
    auto parsed = JSONValue::TryParse(json);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["text"].GetString(), "quote \" and \\ and\nnewline");
}

TEST(JSONTest, BuildArray) {
    JSONValue list;
    list.Push(JSONValue(1));
    list.Push(JSONValue("two"));
    EXPECT_TRUE(list.IsArray());
    EXPECT_EQ(list.ToJSON(), R"([1,"two"])");
}

TEST(JSONTest, MalformedInput) {
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,2,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} trailing").has_value());
    EXPECT_THROW(JSONValue::Parse("nope"), std::runtime_error);
}

// ============================================================================
// Base64url Tests
// ============================================================================

TEST(Base64Test, EncodeWithoutPadding) {
    EXPECT_EQ(Base64UrlEncode(std::string("")), "");
    EXPECT_EQ(Base64UrlEncode(std::string("f")), "Zg");
    EXPECT_EQ(Base64UrlEncode(std::string("fo")), "Zm8");
    EXPECT_EQ(Base64UrlEncode(std::string("foo")), "Zm9v");
    EXPECT_EQ(Base64UrlEncode(std::string("hello")), "aGVsbG8");
}

TEST(Base64Test, UsesUrlSafeAlphabet) {
    std::vector<uint8_t> bytes{0xfb, 0xff};
    EXPECT_EQ(Base64UrlEncode(bytes), "-_8");
    auto decoded = Base64UrlDecode("-_8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST(Base64Test, DecodeString) {
    EXPECT_EQ(Base64UrlDecodeString("aGVsbG8"), std::optional<std::string>("hello"));
}

TEST(Base64Test, RejectsInvalidInput) {
    EXPECT_FALSE(Base64UrlDecode("aGVsbG8=").has_value());   // padding
    EXPECT_FALSE(Base64UrlDecode("+/8").has_value());        // standard alphabet
    EXPECT_FALSE(Base64UrlDecode("a").has_value());          // impossible length
    EXPECT_FALSE(Base64UrlDecode("ab c").has_value());
}

} // namespace test
} // namespace util
} // namespace tally
