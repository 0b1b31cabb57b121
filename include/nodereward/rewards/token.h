// NODEREWARD - Token Source
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Boundary to whatever holds the reward asset. Settlement pays through this
// interface either by transferring from a treasury account or by minting.

#ifndef NODEREWARD_REWARDS_TOKEN_H
#define NODEREWARD_REWARDS_TOKEN_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace nodereward {
namespace rewards {

enum class AssetMode : uint8_t {
    Transfer = 0,   // Pay out of the treasury balance
    Mint = 1,       // Create new units; no balance precondition
};

const char* AssetModeToString(AssetMode mode);
std::optional<AssetMode> AssetModeFromString(const std::string& str);

// ============================================================================
// Token Source Interface
// ============================================================================

class ITokenSource {
public:
    virtual ~ITokenSource() = default;

    virtual Amount BalanceOf(const OperatorId& account) const = 0;

    /// InsufficientBalance or TransferFailed on failure
    virtual Status Transfer(const OperatorId& from, const OperatorId& to, Amount amount) = 0;

    virtual Status Mint(const OperatorId& to, Amount amount) = 0;

    /**
     * Undo a payment: move amount from the recipient back to the payer, or
     * destroy it when the payer is null (a reversed mint).
     */
    virtual Status Reclaim(const OperatorId& from, const OperatorId& to, Amount amount) = 0;
};

// ============================================================================
// Token Vault
// ============================================================================

/**
 * In-process balance table implementing ITokenSource.
 */
class TokenVault : public ITokenSource {
public:
    TokenVault() = default;

    Amount BalanceOf(const OperatorId& account) const override;
    Status Transfer(const OperatorId& from, const OperatorId& to, Amount amount) override;
    Status Mint(const OperatorId& to, Amount amount) override;
    Status Reclaim(const OperatorId& from, const OperatorId& to, Amount amount) override;

    /// Seed an account balance
    void Credit(const OperatorId& account, Amount amount);

    /// Make Transfer and Mint fail with TransferFailed
    void SetFailPayments(bool fail);

    Amount TotalMinted() const;
    Amount TotalSupply() const;

private:
    std::map<OperatorId, Amount> balances_;
    Amount minted_{0};
    bool failPayments_{false};
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_TOKEN_H
