// NODEREWARD - Time-Locked Operations Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/timelock.h"
#include "nodereward/crypto/sha256.h"
#include "nodereward/util/logging.h"

namespace nodereward {
namespace resilience {

// ============================================================================
// TimelockProposal
// ============================================================================

std::vector<Byte> TimelockProposal::Serialize() const {
    DataStream ss;
    ss << proposer << proposedAt << executeAfter << description << executed << executedAt;
    WriteCompactSize(ss, payload.size());
    ss.Write(payload.data(), payload.size());
    return ss.Data();
}

std::optional<TimelockProposal> TimelockProposal::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        TimelockProposal proposal;
        ss >> proposal.proposer >> proposal.proposedAt >> proposal.executeAfter
           >> proposal.description >> proposal.executed >> proposal.executedAt;
        uint64_t size = ReadCompactSize(ss);
        if (size > ss.size()) {
            return std::nullopt;
        }
        proposal.payload.resize(size);
        ss.Read(proposal.payload.data(), size);
        return proposal;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// TimelockController
// ============================================================================

TimelockController::TimelockController(db::Database& db,
                                       const access::IPermissionChecker& permissions,
                                       events::EventBus* bus)
    : db_(db), permissions_(permissions), bus_(bus) {}

void TimelockController::SetDelayBounds(int64_t minDelay, int64_t maxDelay) {
    std::lock_guard<std::mutex> lock(mutex_);
    minDelay_ = minDelay;
    maxDelay_ = maxDelay;
}

OperationHash TimelockController::HashPayload(const std::vector<Byte>& payload) {
    return OperationHash(SHA256Hash(payload));
}

Status TimelockController::Propose(const CallerId& caller, const std::vector<Byte>& payload,
                                   int64_t delay, const std::string& description,
                                   OperationHash* out) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "propose requires admin");
    }
    if (payload.empty()) {
        return Status::Error(ErrorCode::InvalidArgument, "empty command");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (delay < minDelay_ || delay > maxDelay_) {
        return Status::Error(ErrorCode::DelayOutOfRange,
                             std::to_string(delay) + " not in [" + std::to_string(minDelay_) +
                             ", " + std::to_string(maxDelay_) + "]");
    }

    OperationHash hash = HashPayload(payload);
    std::string key = db::MakeKey(db::prefix::TIMELOCK, hash);

    TimelockProposal existing;
    db::Status s = db::ReadEntity(db_, key, &existing);
    if (s.ok() && !existing.executed) {
        return Status::Error(ErrorCode::ProposalExists, hash.ToHex());
    }
    if (!s.ok() && !s.IsNotFound()) {
        return db::ToDomainStatus(s, "read proposal");
    }

    TimelockProposal proposal;
    proposal.proposer = caller;
    proposal.proposedAt = util::GetTime();
    proposal.executeAfter = proposal.proposedAt + delay;
    proposal.description = description;
    proposal.payload = payload;

    s = db::WriteEntity(db_, key, proposal);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "write proposal");
    }

    LOG_INFO(util::LogCategory::TIMELOCK) << "Proposed " << hash.ToHex() << " (" << description
                                          << "), executable at "
                                          << util::FormatISO8601(proposal.executeAfter);
    if (bus_) {
        events::Event event(events::EventType::OperationProposed, hash.ToHex(), proposal.proposedAt);
        event.WithActor(caller)
             .Value("description", description)
             .Value("executeAfter", proposal.executeAfter);
        bus_->Publish(event);
    }

    if (out) {
        *out = hash;
    }
    return Status::Ok();
}

Status TimelockController::Execute(const CallerId& caller, const OperationHash& hash,
                                   IProposalExecutor& executor) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "execute requires admin");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = db::MakeKey(db::prefix::TIMELOCK, hash);
    TimelockProposal proposal;
    db::Status s = db::ReadEntity(db_, key, &proposal);
    if (s.IsNotFound()) {
        return Status::Error(ErrorCode::ProposalNotFound, hash.ToHex());
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read proposal");
    }
    if (proposal.executed) {
        return Status::Error(ErrorCode::AlreadyExecuted, hash.ToHex());
    }

    Timestamp now = util::GetTime();
    if (now < proposal.executeAfter) {
        return Status::Error(ErrorCode::TimelockNotReady,
                             "ready in " + util::FormatDuration(proposal.executeAfter - now));
    }

    db::WriteBatch batch;
    std::function<void()> onCommit;
    Status result = executor.PrepareProposal(hash, proposal.payload, batch, &onCommit);
    if (!result.ok()) {
        LOG_WARN(util::LogCategory::TIMELOCK) << "Execution of " << hash.ToHex()
                                              << " failed: " << result.ToString();
        return Status::Error(ErrorCode::CommandFailed, result.ToString());
    }

    proposal.executed = true;
    proposal.executedAt = now;
    batch.Put(key, db::ToValue(proposal.Serialize()));
    s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TIMELOCK) << "Could not commit execution of " << hash.ToHex()
                                               << ": " << s.ToString();
        return db::ToDomainStatus(s, "commit execution");
    }
    if (onCommit) {
        onCommit();
    }

    LOG_INFO(util::LogCategory::TIMELOCK) << "Executed " << hash.ToHex() << " ("
                                          << proposal.description << ")";
    if (bus_) {
        events::Event event(events::EventType::OperationExecuted, hash.ToHex(), now);
        event.WithActor(caller)
             .Field("executed", "false", "true")
             .Value("description", proposal.description);
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status TimelockController::Cancel(const CallerId& caller, const OperationHash& hash) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "cancel requires admin");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = db::MakeKey(db::prefix::TIMELOCK, hash);
    TimelockProposal proposal;
    db::Status s = db::ReadEntity(db_, key, &proposal);
    if (s.IsNotFound()) {
        return Status::Error(ErrorCode::ProposalNotFound, hash.ToHex());
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read proposal");
    }
    if (proposal.executed) {
        return Status::Error(ErrorCode::AlreadyExecuted, hash.ToHex());
    }

    s = db_.Delete(key);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "delete proposal");
    }

    LOG_INFO(util::LogCategory::TIMELOCK) << "Cancelled " << hash.ToHex();
    if (bus_) {
        events::Event event(events::EventType::OperationCancelled, hash.ToHex(), util::GetTime());
        event.WithActor(caller).Value("description", proposal.description);
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status TimelockController::GetProposal(const OperationHash& hash, TimelockProposal* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Status s = db::ReadEntity(db_, db::MakeKey(db::prefix::TIMELOCK, hash), out);
    if (s.IsNotFound()) {
        return Status::Error(ErrorCode::ProposalNotFound, hash.ToHex());
    }
    return db::ToDomainStatus(s, "read proposal");
}

} // namespace resilience
} // namespace nodereward
