// EQUORUM - Database Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/db/database.h"
#include "equorum/db/leveldb.h"

#include <filesystem>
#include <unistd.h>

namespace equorum {
namespace db {
namespace test {

// ============================================================================
// Shared Behavior
// ============================================================================

class DatabaseTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        if (GetParam()) {
            path_ = std::filesystem::temp_directory_path() /
                    ("equorum_db_test_" + std::to_string(getpid()));
            std::filesystem::remove_all(path_);
            auto [status, db] = OpenDatabase(path_);
            ASSERT_TRUE(status.ok()) << status.ToString();
            db_ = std::move(db);
        } else {
            db_ = OpenMemoryDatabase();
        }
    }

    void TearDown() override {
        db_.reset();
        if (!path_.empty()) {
            EXPECT_TRUE(DestroyDatabase(path_).ok());
            std::filesystem::remove_all(path_);
        }
    }

    std::filesystem::path path_;
    std::unique_ptr<Database> db_;
};

TEST_P(DatabaseTest, PutGetDelete) {
    std::string value;
    EXPECT_TRUE(db_->Get("missing", &value).IsNotFound());

    ASSERT_TRUE(db_->Put("key", "value").ok());
    ASSERT_TRUE(db_->Get("key", &value).ok());
    EXPECT_EQ(value, "value");

    ASSERT_TRUE(db_->Delete("key").ok());
    EXPECT_TRUE(db_->Get("key", &value).IsNotFound());
}

TEST_P(DatabaseTest, BatchAppliesInOrder) {
    ASSERT_TRUE(db_->Put("old", "1").ok());

    WriteBatch batch;
    batch.Delete("old");
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("b");
    batch.Put("b", "3");
    EXPECT_EQ(batch.Count(), 5u);
    ASSERT_TRUE(db_->Write(&batch).ok());

    std::string value;
    EXPECT_TRUE(db_->Get("old", &value).IsNotFound());
    ASSERT_TRUE(db_->Get("b", &value).ok());
    EXPECT_EQ(value, "3");
}

TEST_P(DatabaseTest, IteratorIsOrdered) {
    ASSERT_TRUE(db_->Put(MakeKey('p', "2"), "two").ok());
    ASSERT_TRUE(db_->Put(MakeKey('p', "1"), "one").ok());
    ASSERT_TRUE(db_->Put(MakeKey('q', "1"), "other").ok());

    auto it = db_->NewIterator();
    std::vector<std::string> values;
    for (it->Seek(MakeKey('p')); it->Valid() && it->key().starts_with(MakeKey('p')); it->Next()) {
        values.push_back(it->value().ToString());
    }
    ASSERT_TRUE(it->status().ok());
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "one");
    EXPECT_EQ(values[1], "two");
}

INSTANTIATE_TEST_SUITE_P(Backends, DatabaseTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "LevelDB" : "Memory";
                         });

// ============================================================================
// Specifics
// ============================================================================

TEST(MemoryDatabaseTest, IteratorSeesSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put(WriteOptions(), "a", "1").ok());
    auto it = db.NewIterator(ReadOptions());
    ASSERT_TRUE(db.Put(WriteOptions(), "b", "2").ok());

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(db.Size(), 2u);
}

TEST(StatusTest, Factories) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_TRUE(Status::NotFound("x").IsNotFound());
    EXPECT_TRUE(Status::Corruption("x").IsCorruption());
    EXPECT_EQ(Status::IOError("disk").code(), Status::IO_ERROR);
    EXPECT_NE(Status::IOError("disk").ToString().find("disk"), std::string::npos);
}

TEST(KeyTest, MakeKey) {
    EXPECT_EQ(MakeKey('v'), "v");
    EXPECT_EQ(MakeKey('p', "abc"), "pabc");
}

} // namespace test
} // namespace db
} // namespace equorum
