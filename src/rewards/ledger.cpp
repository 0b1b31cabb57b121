// NODEREWARD - Reward Ledger Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/ledger.h"
#include "nodereward/util/logging.h"

namespace nodereward {
namespace rewards {

namespace {

std::string EncodeAmount(Amount amount) {
    return db::EncodeOrderedU64(static_cast<uint64_t>(amount));
}

} // namespace

RewardLedger::RewardLedger(db::Database& db) : db_(db) {}

// ============================================================================
// Keys
// ============================================================================

std::string RewardLedger::RecordKey(const RewardId& id) {
    return db::MakeKey(db::prefix::REWARD_RECORD, id);
}

std::string RewardLedger::TotalsKey(const OperatorId& operatorId) {
    return db::MakeKey(db::prefix::OPERATOR_TOTALS, operatorId);
}

std::string RewardLedger::BucketKey(const OperatorId& operatorId, BucketKind kind, Epoch epoch) {
    char p = kind == BucketKind::Daily ? db::prefix::DAILY_BUCKET : db::prefix::MONTHLY_BUCKET;
    std::string key = db::MakeKey(p, operatorId);
    key.append(db::EncodeOrderedU64(epoch));
    return key;
}

std::string RewardLedger::IndexPrefix(const OperatorId& operatorId) {
    return db::MakeKey(db::prefix::OPERATOR_INDEX, operatorId);
}

std::string RewardLedger::SlashPrefix(const OperatorId& operatorId) {
    return db::MakeKey(db::prefix::SLASH_HISTORY, operatorId);
}

// ============================================================================
// Loaders
// ============================================================================

Status RewardLedger::LoadTotals(const OperatorId& operatorId, OperatorTotals* out) const {
    db::Status s = db::ReadEntity(db_, TotalsKey(operatorId), out);
    if (s.IsNotFound()) {
        *out = OperatorTotals();
        return Status::Ok();
    }
    return db::ToDomainStatus(s, "read operator totals");
}

Status RewardLedger::LoadBucket(const std::string& key, Amount* out) const {
    std::string value;
    db::Status s = db_.Get(key, &value);
    if (s.IsNotFound()) {
        *out = 0;
        return Status::Ok();
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read bucket");
    }
    if (value.size() != 8) {
        return Status::Error(ErrorCode::StorageError, "corrupt bucket value");
    }
    *out = static_cast<Amount>(db::DecodeOrderedU64(value.data()));
    return Status::Ok();
}

Status RewardLedger::LoadStats(LedgerStats* out) const {
    db::Status s = db::ReadEntity(db_, db::MakeKey(db::prefix::LEDGER_STATS), out);
    if (s.IsNotFound()) {
        *out = LedgerStats();
        return Status::Ok();
    }
    return db::ToDomainStatus(s, "read ledger stats");
}

// ============================================================================
// Transitions
// ============================================================================

Status RewardLedger::AddRecord(const RewardRecord& record, const PeriodCaps& caps) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string dailyKey = BucketKey(record.operatorId, BucketKind::Daily, DayEpoch(record.calculatedAt));
    std::string monthlyKey = BucketKey(record.operatorId, BucketKind::Monthly, MonthEpoch(record.calculatedAt));

    Amount daily = 0;
    Amount monthly = 0;
    Status st = LoadBucket(dailyKey, &daily);
    if (!st.ok()) {
        return st;
    }
    st = LoadBucket(monthlyKey, &monthly);
    if (!st.ok()) {
        return st;
    }

    if (daily + record.amount > caps.daily) {
        return Status::Error(ErrorCode::DailyCapExceeded,
                             FormatAmount(daily) + " + " + FormatAmount(record.amount) +
                             " exceeds " + FormatAmount(caps.daily));
    }
    if (monthly + record.amount > caps.monthly) {
        return Status::Error(ErrorCode::MonthlyCapExceeded,
                             FormatAmount(monthly) + " + " + FormatAmount(record.amount) +
                             " exceeds " + FormatAmount(caps.monthly));
    }

    std::string recordKey = RecordKey(record.id);
    std::string existing;
    db::Status s = db_.Get(recordKey, &existing);
    if (s.ok()) {
        return Status::Error(ErrorCode::DuplicateRewardId, record.id.ToHex());
    }
    if (!s.IsNotFound()) {
        return db::ToDomainStatus(s, "read reward record");
    }

    OperatorTotals totals;
    st = LoadTotals(record.operatorId, &totals);
    if (!st.ok()) {
        return st;
    }
    LedgerStats stats;
    st = LoadStats(&stats);
    if (!st.ok()) {
        return st;
    }

    totals.totalCalculated += record.amount;
    totals.lastCalculationTime = record.calculatedAt;
    ++totals.recordCount;
    stats.totalCalculated += record.amount;
    ++stats.recordCount;

    db::WriteBatch batch;
    batch.Put(recordKey, db::ToValue(record.Serialize()));
    batch.Put(dailyKey, EncodeAmount(daily + record.amount));
    batch.Put(monthlyKey, EncodeAmount(monthly + record.amount));
    batch.Put(TotalsKey(record.operatorId), db::ToValue(totals.Serialize()));
    batch.Put(IndexPrefix(record.operatorId) +
              std::string(reinterpret_cast<const char*>(record.id.data()), record.id.size()), "");
    batch.Put(db::MakeKey(db::prefix::LEDGER_STATS), db::ToValue(stats.Serialize()));

    s = db_.Write(&batch);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "commit reward record");
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << "Added " << record.ToString() << ", day bucket "
                                         << FormatAmount(daily + record.amount);
    return Status::Ok();
}

Status RewardLedger::SettleRecord(const RewardId& id, Timestamp when, RewardRecord* settled) {
    std::lock_guard<std::mutex> lock(mutex_);

    RewardRecord record;
    db::Status s = db::ReadEntity(db_, RecordKey(id), &record);
    if (s.IsNotFound()) {
        return Status::Error(ErrorCode::RecordNotFound, id.ToHex());
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read reward record");
    }
    if (record.settled) {
        return Status::Error(ErrorCode::AlreadyDistributed, id.ToHex());
    }

    OperatorTotals totals;
    Status st = LoadTotals(record.operatorId, &totals);
    if (!st.ok()) {
        return st;
    }
    LedgerStats stats;
    st = LoadStats(&stats);
    if (!st.ok()) {
        return st;
    }

    record.settled = true;
    record.distributedAt = when;
    totals.totalDistributed += record.amount;
    totals.lastDistributionTime = when;
    stats.totalDistributed += record.amount;
    ++stats.settledCount;

    db::WriteBatch batch;
    batch.Put(RecordKey(id), db::ToValue(record.Serialize()));
    batch.Put(TotalsKey(record.operatorId), db::ToValue(totals.Serialize()));
    batch.Put(db::MakeKey(db::prefix::LEDGER_STATS), db::ToValue(stats.Serialize()));

    s = db_.Write(&batch);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "commit settlement");
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << "Settled " << record.ToString();
    if (settled) {
        *settled = record;
    }
    return Status::Ok();
}

Status RewardLedger::AddSlash(const SlashRecord& slash) {
    std::lock_guard<std::mutex> lock(mutex_);

    OperatorTotals totals;
    Status st = LoadTotals(slash.operatorId, &totals);
    if (!st.ok()) {
        return st;
    }
    LedgerStats stats;
    st = LoadStats(&stats);
    if (!st.ok()) {
        return st;
    }

    std::string historyKey = SlashPrefix(slash.operatorId) + db::EncodeOrderedU64(totals.slashCount);

    totals.totalSlashed += slash.amount;
    totals.lastSlashTime = slash.timestamp;
    ++totals.slashCount;
    stats.totalSlashed += slash.amount;
    ++stats.slashCount;

    db::WriteBatch batch;
    batch.Put(historyKey, db::ToValue(slash.Serialize()));
    batch.Put(TotalsKey(slash.operatorId), db::ToValue(totals.Serialize()));
    batch.Put(db::MakeKey(db::prefix::LEDGER_STATS), db::ToValue(stats.Serialize()));

    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "commit slash");
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << "Slashed " << slash.operatorId.ToHex() << " by "
                                         << FormatAmount(slash.amount) << ", total "
                                         << FormatAmount(totals.totalSlashed);
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Status RewardLedger::GetRecord(const RewardId& id, RewardRecord* out) const {
    db::Status s = db::ReadEntity(db_, RecordKey(id), out);
    if (s.IsNotFound()) {
        return Status::Error(ErrorCode::RecordNotFound, id.ToHex());
    }
    return db::ToDomainStatus(s, "read reward record");
}

bool RewardLedger::HasRecord(const RewardId& id) const {
    return db_.Exists(RecordKey(id));
}

Status RewardLedger::GetTotals(const OperatorId& operatorId, OperatorTotals* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadTotals(operatorId, out);
}

Status RewardLedger::GetBucket(const OperatorId& operatorId, BucketKind kind, Epoch epoch,
                               Amount* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadBucket(BucketKey(operatorId, kind, epoch), out);
}

Status RewardLedger::GetRecordsForOperator(const OperatorId& operatorId,
                                           std::vector<RewardRecord>* out) const {
    out->clear();

    std::vector<RewardId> ids;
    std::string prefix = IndexPrefix(operatorId);
    db::Status s = db::ForEachWithPrefix(db_, prefix, [&](const db::Slice& key, const db::Slice&) {
        if (key.size() == prefix.size() + RewardId::SIZE) {
            ids.push_back(RewardId(Hash256(reinterpret_cast<const Byte*>(key.data() + prefix.size()),
                                           RewardId::SIZE)));
        }
        return true;
    });
    if (!s.ok()) {
        return db::ToDomainStatus(s, "scan operator index");
    }

    for (const auto& id : ids) {
        RewardRecord record;
        Status st = GetRecord(id, &record);
        if (!st.ok()) {
            return st;
        }
        out->push_back(std::move(record));
    }
    return Status::Ok();
}

Status RewardLedger::GetPendingAmount(const OperatorId& operatorId, Amount* out) const {
    std::vector<RewardRecord> records;
    Status st = GetRecordsForOperator(operatorId, &records);
    if (!st.ok()) {
        return st;
    }
    Amount pending = 0;
    for (const auto& record : records) {
        if (!record.settled) {
            pending += record.amount;
        }
    }
    *out = pending;
    return Status::Ok();
}

Status RewardLedger::GetSlashHistory(const OperatorId& operatorId,
                                     std::vector<SlashRecord>* out) const {
    out->clear();
    bool corrupt = false;
    db::Status s = db::ForEachWithPrefix(db_, SlashPrefix(operatorId),
                                         [&](const db::Slice&, const db::Slice& value) {
        auto slash = SlashRecord::Deserialize(reinterpret_cast<const Byte*>(value.data()), value.size());
        if (!slash) {
            corrupt = true;
            return false;
        }
        out->push_back(std::move(*slash));
        return true;
    });
    if (!s.ok()) {
        return db::ToDomainStatus(s, "scan slash history");
    }
    if (corrupt) {
        return Status::Error(ErrorCode::StorageError, "corrupt slash record");
    }
    return Status::Ok();
}

Status RewardLedger::GetStats(LedgerStats* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadStats(out);
}

} // namespace rewards
} // namespace nodereward
