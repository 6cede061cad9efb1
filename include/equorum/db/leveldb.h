// EQUORUM - Database Implementations
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// LevelDB-backed and in-memory implementations of db::Database.

#ifndef EQUORUM_DB_LEVELDB_H
#define EQUORUM_DB_LEVELDB_H

#include "equorum/db/database.h"

#include <map>
#include <mutex>

#include <leveldb/cache.h>
#include <leveldb/db.h>

namespace equorum {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db and cache
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache);
    ~LevelDBDatabase() override;

    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    /// Translate a LevelDB status into ours
    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace equorum

#endif // EQUORUM_DB_LEVELDB_H
