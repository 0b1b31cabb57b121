// NODEREWARD - Token Source Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/token.h"
#include "nodereward/rewards/types.h"

namespace nodereward {
namespace rewards {

const char* AssetModeToString(AssetMode mode) {
    switch (mode) {
        case AssetMode::Transfer: return "transfer";
        case AssetMode::Mint: return "mint";
        default: return "unknown";
    }
}

std::optional<AssetMode> AssetModeFromString(const std::string& str) {
    if (str == "transfer") return AssetMode::Transfer;
    if (str == "mint") return AssetMode::Mint;
    return std::nullopt;
}

// ============================================================================
// TokenVault
// ============================================================================

Amount TokenVault::BalanceOf(const OperatorId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Status TokenVault::Transfer(const OperatorId& from, const OperatorId& to, Amount amount) {
    if (amount <= 0 || !MoneyRange(amount)) {
        return Status::Error(ErrorCode::InvalidAmount, FormatAmount(amount));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (failPayments_) {
        return Status::Error(ErrorCode::TransferFailed, "payments disabled");
    }
    Amount& source = balances_[from];
    if (source < amount) {
        return Status::Error(ErrorCode::InsufficientBalance,
                             FormatAmount(source) + " < " + FormatAmount(amount));
    }
    source -= amount;
    balances_[to] += amount;
    return Status::Ok();
}

Status TokenVault::Mint(const OperatorId& to, Amount amount) {
    if (amount <= 0 || !MoneyRange(amount)) {
        return Status::Error(ErrorCode::InvalidAmount, FormatAmount(amount));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (failPayments_) {
        return Status::Error(ErrorCode::TransferFailed, "payments disabled");
    }
    balances_[to] += amount;
    minted_ += amount;
    return Status::Ok();
}

Status TokenVault::Reclaim(const OperatorId& from, const OperatorId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& holder = balances_[from];
    if (holder < amount) {
        return Status::Error(ErrorCode::InsufficientBalance,
                             FormatAmount(holder) + " < " + FormatAmount(amount));
    }
    holder -= amount;
    if (to.IsNull()) {
        minted_ -= amount;
    } else {
        balances_[to] += amount;
    }
    return Status::Ok();
}

void TokenVault::Credit(const OperatorId& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account] += amount;
}

void TokenVault::SetFailPayments(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPayments_ = fail;
}

Amount TokenVault::TotalMinted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minted_;
}

Amount TokenVault::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [account, balance] : balances_) {
        total += balance;
    }
    return total;
}

} // namespace rewards
} // namespace nodereward
