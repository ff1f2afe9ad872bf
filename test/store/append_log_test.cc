#include <gtest/gtest.h>
#include "../../src/store/append_log.h"
#include "../../src/store/ordered_store.h"
#include "../../src/common/errors.h"

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace Strata;

namespace {

std::string Concat(std::string_view, const std::string* existing, std::string_view operand) {
    std::string out = existing ? *existing : std::string();
    out.append(operand.data(), operand.size());
    return out;
}

} // namespace

class AppendLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               ("strata_log_" + std::string(info->name()) + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        path_ = (dir_ / "store.log").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    struct Record {
        LogOp op;
        std::string key;
        std::string value;
    };

    std::vector<Record> ReplayAll() {
        AppendLog log(path_, false);
        log.Open();
        std::vector<Record> records;
        log.Replay([&](LogOp op, std::string_view key, std::string_view value) {
            records.push_back(Record{op, std::string(key), std::string(value)});
        });
        return records;
    }

    std::filesystem::path dir_;
    std::string path_;
};

TEST_F(AppendLogTest, ReplayReturnsRecordsInOrder) {
    {
        AppendLog log(path_, true);
        log.Open();
        EXPECT_EQ(log.Replay([](LogOp, std::string_view, std::string_view) {}), 0u);
        log.Append(LogOp::PUT, "k1", "v1");
        log.Append(LogOp::MERGE, "k2", "abc");
        log.Append(LogOp::DELETE, "k1", "");
        EXPECT_EQ(log.size(), 3 * AppendLog::kRecordHeaderSize + 2 + 2 + 2 + 3 + 2);
    }

    auto records = ReplayAll();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].op, LogOp::PUT);
    EXPECT_EQ(records[0].value, "v1");
    EXPECT_EQ(records[1].op, LogOp::MERGE);
    EXPECT_EQ(records[1].key, "k2");
    EXPECT_EQ(records[2].op, LogOp::DELETE);
}

TEST_F(AppendLogTest, TornTailIsTruncated) {
    {
        AppendLog log(path_, false);
        log.Open();
        log.Replay([](LogOp, std::string_view, std::string_view) {});
        log.Append(LogOp::PUT, "good", "value");
        log.Append(LogOp::PUT, "torn", "value");
    }
    const auto full_size = std::filesystem::file_size(path_);
    std::filesystem::resize_file(path_, full_size - 3);

    auto records = ReplayAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].key, "good");
    EXPECT_EQ(std::filesystem::file_size(path_),
              AppendLog::kRecordHeaderSize + 4 + 5);

    // Appends after recovery land on a clean boundary
    {
        AppendLog log(path_, false);
        log.Open();
        log.Replay([](LogOp, std::string_view, std::string_view) {});
        log.Append(LogOp::PUT, "next", "v");
    }
    records = ReplayAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].key, "next");
}

TEST_F(AppendLogTest, RecordAfterHoleSurvivesReplay) {
    {
        AppendLog log(path_, true);
        log.Open();
        log.Replay([](LogOp, std::string_view, std::string_view) {});
        log.Append(LogOp::PUT, "kA", "first");
    }
    // A writer that reserved 20 bytes and died before its pwrite
    const auto first_end = std::filesystem::file_size(path_);
    std::filesystem::resize_file(path_, first_end + 20);
    {
        AppendLog log(path_, true);
        log.Open();
        EXPECT_EQ(log.size(), first_end + 20);
        log.Append(LogOp::PUT, "kB", "second");
    }
    const auto full_size = std::filesystem::file_size(path_);

    auto records = ReplayAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].key, "kA");
    EXPECT_EQ(records[1].key, "kB");
    EXPECT_EQ(records[1].value, "second");
    EXPECT_EQ(std::filesystem::file_size(path_), full_size);

    // A trailing hole is still trimmed
    std::filesystem::resize_file(path_, full_size + 20);
    EXPECT_EQ(ReplayAll().size(), 2u);
    EXPECT_EQ(std::filesystem::file_size(path_), full_size);
}

TEST_F(AppendLogTest, DamagedRecordIsSkipped) {
    {
        AppendLog log(path_, false);
        log.Open();
        log.Replay([](LogOp, std::string_view, std::string_view) {});
        log.Append(LogOp::PUT, "k1", "v1");
        log.Append(LogOp::PUT, "k2", "v2");
        log.Append(LogOp::PUT, "k3", "v3");
    }
    const auto full_size = std::filesystem::file_size(path_);
    const size_t record_size = AppendLog::kRecordHeaderSize + 4;
    {
        // Flip the last value byte of the middle record
        std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(static_cast<std::streamoff>(2 * record_size - 1));
        file.put('X');
    }

    auto records = ReplayAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].key, "k1");
    EXPECT_EQ(records[1].key, "k3");
    EXPECT_EQ(std::filesystem::file_size(path_), full_size);
}

TEST_F(AppendLogTest, AppendBeforeOpenThrows) {
    AppendLog log(path_, false);
    EXPECT_THROW(log.Append(LogOp::PUT, "k", "v"), StorageError);
}

TEST_F(AppendLogTest, OpenFailureThrows) {
    AppendLog log((dir_ / "missing" / "store.log").string(), false);
    EXPECT_THROW(log.Open(), StorageError);
}

TEST_F(AppendLogTest, ConcurrentAppendsAllReplay) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    {
        AppendLog log(path_, false);
        log.Open();
        log.Replay([](LogOp, std::string_view, std::string_view) {});
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&log, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    log.Append(LogOp::MERGE, "t" + std::to_string(t), std::to_string(i));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
    EXPECT_EQ(ReplayAll().size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(AppendLogTest, DurableStoreSurvivesReopen) {
    StoreOptions options;
    options.path = path_;
    options.num_shards = 4;
    {
        OrderedStore store(options);
        Tree tree = store.OpenTree(7, "data", 0, &Concat);
        store.Recover();
        EXPECT_TRUE(store.durable());
        tree.Put("a", "1");
        tree.Merge("b", "x");
        tree.Merge("b", "y");
        tree.Put("c", "3");
        tree.Delete("c");
        store.Sync();
    }
    OrderedStore store(options);
    Tree tree = store.OpenTree(7, "data", 0, &Concat);
    store.Recover();
    EXPECT_EQ(tree.Get("a").value(), "1");
    EXPECT_EQ(tree.Get("b").value(), "xy");
    EXPECT_FALSE(tree.Get("c").has_value());
    EXPECT_EQ(store.Size(), 2u);
}
