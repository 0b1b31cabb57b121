// NODEREWARD - Reward Distributor
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Settles pending reward records: verify, pay through the token source,
// then commit the ledger. If the ledger commit fails after payment, the
// payment is reclaimed so that neither side persists.

#ifndef NODEREWARD_REWARDS_DISTRIBUTOR_H
#define NODEREWARD_REWARDS_DISTRIBUTOR_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/rewards/context.h"
#include "nodereward/rewards/token.h"
#include "nodereward/rewards/types.h"

#include <mutex>
#include <set>
#include <vector>

namespace nodereward {
namespace rewards {

class RewardDistributor {
public:
    RewardDistributor(const RewardContext& ctx, ITokenSource& tokens,
                      AssetMode mode = AssetMode::Transfer, const OperatorId& treasury = OperatorId());

    /**
     * Settle one record (Distribute capability, gated as
     * "rewardDistribution"). Fails RecordNotFound, AlreadyDistributed,
     * InsufficientBalance (Transfer mode only) or TransferFailed.
     * PaymentUnreconciled when the ledger rejected the settlement and the
     * payment could not be taken back; the record is then refused until
     * ClearUnreconciled.
     */
    Status Distribute(const CallerId& caller, const RewardId& id);

    /// Settlement body for a caller already admitted by the gates
    Status DistributeAdmitted(const CallerId& caller, const RewardId& id);

    /// Balance available to pay from; unlimited in Mint mode
    bool CanPay(Amount amount) const;

    void SetAssetMode(AssetMode mode);
    AssetMode GetAssetMode() const;

    void SetTreasury(const OperatorId& treasury);
    OperatorId GetTreasury() const;

    /// Records paid out without a matching settlement
    std::vector<RewardId> GetUnreconciled() const;

    /// Release a record once the operator's payment has been settled by hand; false if not marked
    bool ClearUnreconciled(const RewardId& id);

private:
    Status Pay(const OperatorId& to, Amount amount, AssetMode mode, const OperatorId& treasury);
    Status Unpay(const OperatorId& from, Amount amount, AssetMode mode, const OperatorId& treasury);

    const RewardContext& ctx_;
    ITokenSource& tokens_;
    AssetMode mode_;
    OperatorId treasury_;
    std::set<RewardId> unreconciled_;
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_DISTRIBUTOR_H
