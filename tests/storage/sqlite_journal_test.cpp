// File: tests/storage/sqlite_journal_test.cpp
#include "storage/sqlite_journal.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <thread>

namespace geochron {
namespace {

std::string GetTempDbPath() {
    static std::atomic<int> counter{0};
    return "/tmp/test_geochron_journal_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

std::vector<std::string> Ids(const std::vector<Record>& records) {
    std::vector<std::string> ids;
    for (const auto& record : records) {
        ids.push_back(record.id);
    }
    return ids;
}

class SqliteJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
    }

    void TearDown() override {
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    std::unique_ptr<SqliteJournal> Open() {
        SqliteJournal::Config config;
        config.db_path = db_path_;
        return std::make_unique<SqliteJournal>(config);
    }

    std::string db_path_;
};

// ============================================================================
// Constructor Tests
// ============================================================================

TEST_F(SqliteJournalTest, OpensEmptyDatabase) {
    auto journal = Open();

    EXPECT_EQ(db_path_, journal->GetPath());
    EXPECT_EQ(0u, journal->Count("db"));
    EXPECT_TRUE(std::filesystem::exists(db_path_));
}

TEST(SqliteJournalConfigTest, EmptyPathRejected) {
    SqliteJournal::Config config;
    EXPECT_THROW(SqliteJournal{config}, std::invalid_argument);
}

TEST(SqliteJournalConfigTest, UnopenablePathFails) {
    SqliteJournal::Config config;
    config.db_path = "/nonexistent_dir_geochron/sub/journal.db";
    EXPECT_THROW(SqliteJournal{config}, std::runtime_error);
}

TEST(SqliteJournalConfigTest, InMemoryDatabase) {
    SqliteJournal::Config config;
    config.db_path = ":memory:";
    config.enable_wal = false;
    SqliteJournal journal(config);

    EXPECT_TRUE(journal.Append(Record::MakeFeature("db", "f", Geometry::Point(1, 1))));
    EXPECT_EQ(1u, journal.Count("db"));
}

// ============================================================================
// Write Tests
// ============================================================================

TEST_F(SqliteJournalTest, AppendRejectsDuplicateId) {
    auto journal = Open();

    EXPECT_TRUE(journal->Append(Record::MakeFeature("db", "f1", Geometry::Point(0, 0))));
    EXPECT_FALSE(journal->Append(Record::MakeFeature("db", "f1", Geometry::Point(9, 9))));
    EXPECT_TRUE(journal->Append(Record::MakePoint("db2", "s", "f1", 1, 1.0)));

    EXPECT_EQ(1u, journal->Count("db"));
}

TEST_F(SqliteJournalTest, DeleteAndDropDatabase) {
    auto journal = Open();
    journal->Append(Record::MakeFeature("db", "a", Geometry::Point(0, 0)));
    journal->Append(Record::MakeFeature("db", "b", Geometry::Point(0, 0)));
    journal->Append(Record::MakeFeature("keep", "a", Geometry::Point(0, 0)));

    EXPECT_TRUE(journal->Delete("db", "a"));
    EXPECT_FALSE(journal->Delete("db", "a"));

    EXPECT_EQ(1u, journal->DropDatabase("db"));
    EXPECT_EQ(0u, journal->Count("db"));
    EXPECT_EQ(1u, journal->Count("keep"));
}

// ============================================================================
// Read Tests
// ============================================================================

TEST_F(SqliteJournalTest, FetchByIdsRestoresFullRecord) {
    auto journal = Open();
    auto feature = Record::MakeFeature(
        "cities", "sf_bay",
        Geometry::Polygon({{-122.5, 37.7}, {-122.3, 37.7}, {-122.3, 37.9}, {-122.5, 37.7}}),
        {{"name", "Bay"}}, {{"source", "survey"}});
    journal->Append(feature);
    journal->Append(Record::MakeFeature("cities", "nyc", Geometry::Point(-74.0, 40.7)));

    auto fetched = journal->FetchByIds("cities", {"nyc", "ghost", "sf_bay"});

    ASSERT_EQ(2u, fetched.size());
    EXPECT_EQ("nyc", fetched[0].id);
    EXPECT_EQ(feature, fetched[1]);
}

TEST_F(SqliteJournalTest, FullScanBBoxIsInclusiveAndSorted) {
    auto journal = Open();
    journal->Append(Record::MakeFeature("db", "edge", Geometry::Point(10, 10)));
    journal->Append(Record::MakeFeature("db", "inside", Geometry::Point(5, 5)));
    journal->Append(Record::MakeFeature("db", "outside", Geometry::Point(11, 11)));
    journal->Append(Record::MakePoint("db", "s", "point", 5, 1.0));

    EXPECT_EQ((std::vector<std::string>{"edge", "inside"}),
              Ids(journal->FullScanBBox("db", BoundingBox(0, 0, 10, 10))));
}

TEST_F(SqliteJournalTest, FullScanTimeSeriesOrdersByTimestampThenId) {
    auto journal = Open();
    journal->Append(Record::MakePoint("db", "s", "b", 2, 1.0));
    journal->Append(Record::MakePoint("db", "s", "a", 2, 1.0));
    journal->Append(Record::MakePoint("db", "s", "c", 1, 1.0));
    journal->Append(Record::MakePoint("db", "s", "late", 100, 1.0));
    journal->Append(Record::MakePoint("db", "other", "x", 2, 1.0));

    EXPECT_EQ((std::vector<std::string>{"c", "a", "b"}),
              Ids(journal->FullScanTimeSeries("db", "s", 0, 10)));
}

TEST_F(SqliteJournalTest, ListSeries) {
    auto journal = Open();
    journal->Append(Record::MakePoint("db", "zeta", "p1", 1, 1.0));
    journal->Append(Record::MakePoint("db", "alpha", "p2", 1, 1.0));
    journal->Append(Record::MakePoint("db", "alpha", "p3", 2, 1.0));
    journal->Append(Record::MakeFeature("db", "f", Geometry::Point(0, 0)));

    EXPECT_EQ((std::vector<std::string>{"alpha", "zeta"}), journal->ListSeries("db"));
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(SqliteJournalTest, RecordsSurviveReopen) {
    {
        auto journal = Open();
        journal->Append(Record::MakePoint("sensors", "sensor_001", "p1", 60, 21.0,
                                          {{"unit", "C"}}));
        journal->Append(Record::MakeFeature("cities", "nyc", Geometry::Point(-74.0, 40.7)));
    }

    auto reopened = Open();
    EXPECT_EQ(1u, reopened->Count("sensors"));

    auto points = reopened->FullScanTimeSeries("sensors", "sensor_001", 0, 100);
    ASSERT_EQ(1u, points.size());
    EXPECT_DOUBLE_EQ(21.0, points[0].value);
    EXPECT_EQ("C", points[0].metadata.at("unit"));

    // Uniqueness is enforced across sessions too
    EXPECT_FALSE(reopened->Append(Record::MakeFeature("cities", "nyc", Geometry::Point(0, 0))));
}

TEST_F(SqliteJournalTest, ConcurrentAppends) {
    auto journal = Open();
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&journal, t]() {
            for (int i = 0; i < 50; ++i) {
                journal->Append(Record::MakePoint("db", "s" + std::to_string(t),
                                                  std::to_string(t) + "_" + std::to_string(i),
                                                  i, static_cast<double>(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(200u, journal->Count("db"));
    EXPECT_EQ(4u, journal->ListSeries("db").size());
}

TEST_F(SqliteJournalTest, FactoryCreatesSqliteJournal) {
    auto journal = CreateJournal(JournalBackend::SQLITE, db_path_);

    ASSERT_NE(nullptr, journal);
    EXPECT_TRUE(journal->Append(Record::MakeFeature("db", "f", Geometry::Point(0, 0))));
}

}  // namespace
}  // namespace geochron
