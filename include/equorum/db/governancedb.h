// EQUORUM - Governance Database
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Persistent storage of the governance engine state. The whole state is
// written as one atomic batch, so a crash never leaves a mix of old and
// new records.

#ifndef EQUORUM_DB_GOVERNANCEDB_H
#define EQUORUM_DB_GOVERNANCEDB_H

#include "equorum/db/database.h"
#include "equorum/governance/governor.h"

#include <memory>
#include <string>

namespace equorum {
namespace db {

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char VERSION = 'v';        // -> schema version
    constexpr char LOCK = 'l';           // address -> lock
    constexpr char PROPOSAL = 'p';       // big-endian id -> proposal
    constexpr char ENTRY = 'e';          // content hash -> timelock entry
    constexpr char ADMIN = 'a';          // -> timelock admin
    constexpr char PENDING_ADMIN = 'A';  // -> nominated admin (absent if none)
}

/// Current on-disk schema
constexpr uint32_t GOVERNANCE_DB_VERSION = 1;

// ============================================================================
// GovernanceDB
// ============================================================================

class GovernanceDB {
public:
    explicit GovernanceDB(std::unique_ptr<Database> db);

    GovernanceDB(const GovernanceDB&) = delete;
    GovernanceDB& operator=(const GovernanceDB&) = delete;

    /// Replace all stored governance records with snapshot
    Status WriteSnapshot(const governance::GovernanceSnapshot& snapshot, bool sync = true);

    /**
     * Load the stored state.
     * @return NotFound if nothing was ever written, Corruption if a record
     *         does not decode
     */
    Status ReadSnapshot(governance::GovernanceSnapshot* snapshot);

    /// True once a snapshot has been written
    bool HasSnapshot();

private:
    /// Append deletes for every governance record currently stored
    Status ClearRecords(WriteBatch& batch);

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace equorum

#endif // EQUORUM_DB_GOVERNANCEDB_H
