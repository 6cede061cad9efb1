// EQUORUM - Governance Database Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/db/governancedb.h"
#include "equorum/core/serialize.h"
#include "equorum/util/logging.h"

namespace equorum {
namespace db {

namespace {

std::string ToString(const std::vector<Byte>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

const Byte* AsBytes(const std::string& s) {
    return reinterpret_cast<const Byte*>(s.data());
}

/// Big-endian so that iteration order matches id order
std::string EncodeProposalId(governance::ProposalId id) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<char>(id & 0xFF);
        id >>= 8;
    }
    return out;
}

template<size_t BITS>
std::string HashSuffix(const BaseHash<BITS>& hash) {
    return std::string(reinterpret_cast<const char*>(hash.data()), BaseHash<BITS>::SIZE);
}

bool IsGovernanceKey(const Slice& key) {
    if (key.empty()) {
        return false;
    }
    switch (key.data()[0]) {
        case prefix::VERSION:
        case prefix::LOCK:
        case prefix::PROPOSAL:
        case prefix::ENTRY:
        case prefix::ADMIN:
        case prefix::PENDING_ADMIN:
            return true;
        default:
            return false;
    }
}

} // namespace

GovernanceDB::GovernanceDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

Status GovernanceDB::ClearRecords(WriteBatch& batch) {
    auto it = db_->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (IsGovernanceKey(it->key())) {
            batch.Delete(it->key());
        }
    }
    return it->status();
}

Status GovernanceDB::WriteSnapshot(const governance::GovernanceSnapshot& snapshot, bool sync) {
    if (!db_) {
        return Status::NotSupported("Database not open");
    }

    WriteBatch batch;
    Status s = ClearRecords(batch);
    if (!s.ok()) {
        return s;
    }

    DataStream version;
    version << GOVERNANCE_DB_VERSION;
    batch.Put(MakeKey(prefix::VERSION), ToString(version.Bytes()));

    for (const auto& [principal, info] : snapshot.locks) {
        batch.Put(MakeKey(prefix::LOCK, HashSuffix(principal)), ToString(info.Serialize()));
    }
    for (const auto& proposal : snapshot.proposals) {
        batch.Put(MakeKey(prefix::PROPOSAL, EncodeProposalId(proposal.id)),
                  ToString(proposal.Serialize()));
    }
    for (const auto& entry : snapshot.entries) {
        batch.Put(MakeKey(prefix::ENTRY, HashSuffix(entry.hash)), ToString(entry.Serialize()));
    }
    batch.Put(MakeKey(prefix::ADMIN), HashSuffix(snapshot.admin));
    if (!snapshot.pendingAdmin.IsNull()) {
        batch.Put(MakeKey(prefix::PENDING_ADMIN), HashSuffix(snapshot.pendingAdmin));
    }

    WriteOptions opts;
    opts.sync = sync;
    s = db_->Write(opts, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to write governance snapshot: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Wrote governance snapshot (" << batch.Count()
                                     << " operations)";
    return Status::Ok();
}

bool GovernanceDB::HasSnapshot() {
    if (!db_) {
        return false;
    }
    std::string value;
    return db_->Get(MakeKey(prefix::VERSION), &value).ok();
}

Status GovernanceDB::ReadSnapshot(governance::GovernanceSnapshot* snapshot) {
    if (!db_) {
        return Status::NotSupported("Database not open");
    }

    std::string value;
    Status s = db_->Get(MakeKey(prefix::VERSION), &value);
    if (!s.ok()) {
        return s;
    }
    try {
        DataStream ss(AsBytes(value), value.size());
        uint32_t version = 0;
        ss >> version;
        if (version != GOVERNANCE_DB_VERSION) {
            return Status::NotSupported("governance schema version " + std::to_string(version));
        }
    } catch (const std::ios_base::failure&) {
        return Status::Corruption("bad schema version record");
    }

    governance::GovernanceSnapshot result;

    s = db_->Get(MakeKey(prefix::ADMIN), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? Status::Corruption("missing admin record") : s;
    }
    if (value.size() != Address::SIZE) {
        return Status::Corruption("bad admin record");
    }
    result.admin = Address(AsBytes(value), value.size());

    s = db_->Get(MakeKey(prefix::PENDING_ADMIN), &value);
    if (s.ok()) {
        if (value.size() != Address::SIZE) {
            return Status::Corruption("bad pending admin record");
        }
        result.pendingAdmin = Address(AsBytes(value), value.size());
    } else if (!s.IsNotFound()) {
        return s;
    }

    auto it = db_->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        Slice key = it->key();
        Slice val = it->value();
        const Byte* data = reinterpret_cast<const Byte*>(val.data());

        if (key.size() == 1 + Address::SIZE && key.data()[0] == prefix::LOCK) {
            auto info = governance::LockInfo::Deserialize(data, val.size());
            if (!info) {
                return Status::Corruption("bad lock record");
            }
            Address principal(reinterpret_cast<const Byte*>(key.data()) + 1, Address::SIZE);
            result.locks[principal] = *info;
        } else if (key.size() == 9 && key.data()[0] == prefix::PROPOSAL) {
            auto proposal = governance::Proposal::Deserialize(data, val.size());
            if (!proposal) {
                return Status::Corruption("bad proposal record");
            }
            result.proposals.push_back(std::move(*proposal));
        } else if (key.size() == 1 + Hash256::SIZE && key.data()[0] == prefix::ENTRY) {
            auto entry = governance::TimelockEntry::Deserialize(data, val.size());
            if (!entry) {
                return Status::Corruption("bad timelock entry record");
            }
            Hash256 keyHash(reinterpret_cast<const Byte*>(key.data()) + 1, Hash256::SIZE);
            if (entry->hash != keyHash) {
                return Status::Corruption("timelock entry hash mismatch");
            }
            result.entries.push_back(std::move(*entry));
        }
    }
    s = it->status();
    if (!s.ok()) {
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Read governance snapshot: " << result.locks.size()
                                     << " locks, " << result.proposals.size() << " proposals, "
                                     << result.entries.size() << " entries";
    *snapshot = std::move(result);
    return Status::Ok();
}

} // namespace db
} // namespace equorum
