// =============================================================================
// ledger.cpp - RedeemLedger Implementation
// =============================================================================

#include "avault/ledger.hpp"
#include "avault/math.hpp"
#include <stdexcept>

namespace avault {

// =============================================================================
// Journal
// =============================================================================

RedeemLedger::Journal::Journal(RedeemLedger& ledger) : ledger_(ledger) {
    ledger_.journal_ = this;
}

RedeemLedger::Journal::~Journal() {
    if (!committed_) rollback();
    ledger_.journal_ = nullptr;
}

void RedeemLedger::Journal::commit() {
    committed_ = true;
    pending_.clear();
    claimable_.clear();
    totals_.clear();
}

void RedeemLedger::Journal::rollback() {
    for (const auto& [key, original] : pending_) {
        if (original) ledger_.pending_[key] = *original;
        else ledger_.pending_.erase(key);
    }
    for (const auto& [key, original] : claimable_) {
        if (original) ledger_.claimable_[key] = *original;
        else ledger_.claimable_.erase(key);
    }
    for (const auto& [asset, original] : totals_) {
        if (original) ledger_.totals_[asset] = *original;
        else ledger_.totals_.erase(asset);
    }
    pending_.clear();
    claimable_.clear();
    totals_.clear();
}

RedeemLedger::Journal RedeemLedger::begin() {
    if (journal_ != nullptr) {
        throw std::logic_error("ledger journal already open");
    }
    return Journal(*this);
}

void RedeemLedger::save_pending(const RedeemKey& key) {
    if (!journal_ || journal_->pending_.count(key)) return;
    auto it = pending_.find(key);
    journal_->pending_.emplace(key, it == pending_.end()
        ? std::nullopt : std::optional<PendingRedeem>(it->second));
}

void RedeemLedger::save_claimable(const RedeemKey& key) {
    if (!journal_ || journal_->claimable_.count(key)) return;
    auto it = claimable_.find(key);
    journal_->claimable_.emplace(key, it == claimable_.end()
        ? std::nullopt : std::optional<ClaimableRedeem>(it->second));
}

void RedeemLedger::save_totals(const Asset& asset) {
    if (!journal_ || journal_->totals_.count(asset)) return;
    auto it = totals_.find(asset);
    journal_->totals_.emplace(asset, it == totals_.end()
        ? std::nullopt : std::optional<AssetTotals>(it->second));
}

void RedeemLedger::store_pending(const RedeemKey& key, const PendingRedeem& record) {
    save_pending(key);
    if (record.shares == 0) {
        pending_.erase(key);
    } else {
        pending_[key] = record;
    }
}

void RedeemLedger::store_claimable(const RedeemKey& key, const ClaimableRedeem& record) {
    save_claimable(key);
    if (record.assets == 0 && record.shares == 0) {
        claimable_.erase(key);
    } else {
        claimable_[key] = record;
    }
}

void RedeemLedger::store_totals(const Asset& asset, const AssetTotals& totals) {
    save_totals(asset);
    if (totals.pending_shares == 0 && totals.claimable_assets == 0 && totals.claimable_shares == 0) {
        totals_.erase(asset);
    } else {
        totals_[asset] = totals;
    }
}

// =============================================================================
// Pending
// =============================================================================

void RedeemLedger::increase_pending(const Address& account, const Asset& asset,
                                    U128 amount, uint64_t now) {
    RedeemKey key{account, asset};
    PendingRedeem record = pending(account, asset);
    AssetTotals totals = asset_totals(asset);

    auto shares = math::checked_add(record.shares, amount);
    if (!shares) throw VaultError(errors::TOO_MANY_SHARES, "pending shares");
    auto total = math::checked_add(totals.pending_shares, amount);
    if (!total) throw VaultError(errors::TOO_MANY_SHARES, "asset pending shares");

    if (*shares == 0) return;

    record.shares = *shares;
    record.request_time = now;
    totals.pending_shares = *total;

    store_pending(key, record);
    store_totals(asset, totals);
}

void RedeemLedger::consume_pending(const Address& account, const Asset& asset, U128 amount) {
    RedeemKey key{account, asset};
    PendingRedeem record = pending(account, asset);

    if (amount > record.shares) {
        throw VaultError(errors::INSUFFICIENT_PENDING_SHARES,
                         math::to_string(amount) + " > " + math::to_string(record.shares));
    }
    if (amount == 0) return;

    AssetTotals totals = asset_totals(asset);
    record.shares -= amount;
    if (record.shares == 0) record.request_time = 0;
    totals.pending_shares -= amount;

    store_pending(key, record);
    store_totals(asset, totals);
}

// =============================================================================
// Claimable
// =============================================================================

void RedeemLedger::increase_claimable(const Address& account, const Asset& asset,
                                      U128 assets, U128 shares) {
    RedeemKey key{account, asset};
    ClaimableRedeem record = claimable(account, asset);
    AssetTotals totals = asset_totals(asset);

    auto new_assets = math::checked_add(record.assets, assets);
    if (!new_assets) throw VaultError(errors::TOO_MANY_ASSETS, "claimable assets");
    auto new_shares = math::checked_add(record.shares, shares);
    if (!new_shares) throw VaultError(errors::TOO_MANY_SHARES, "claimable shares");
    auto total_assets = math::checked_add(totals.claimable_assets, assets);
    if (!total_assets) throw VaultError(errors::TOO_MANY_ASSETS, "asset claimable assets");
    auto total_shares = math::checked_add(totals.claimable_shares, shares);
    if (!total_shares) throw VaultError(errors::TOO_MANY_SHARES, "asset claimable shares");

    if (assets == 0 && shares == 0) return;

    record.assets = *new_assets;
    record.shares = *new_shares;
    totals.claimable_assets = *total_assets;
    totals.claimable_shares = *total_shares;

    store_claimable(key, record);
    store_totals(asset, totals);
}

U128 RedeemLedger::consume_claimable_by_assets(const Address& account, const Asset& asset, U128 assets) {
    RedeemKey key{account, asset};
    ClaimableRedeem record = claimable(account, asset);

    U128 shares;
    if (assets == record.assets) {
        // Full withdrawal takes the stored shares exactly
        shares = record.shares;
    } else if (assets > record.assets) {
        throw VaultError(errors::INSUFFICIENT_CLAIMABLE_ASSETS,
                         math::to_string(assets) + " > " + math::to_string(record.assets));
    } else {
        // Round up: the holder gives up at least the proportional shares.
        // assets < record.assets keeps the result <= record.shares.
        shares = *math::mul_div_up(assets, record.shares, record.assets);
    }

    decrease_claimable(key, record, assets, shares);
    return shares;
}

U128 RedeemLedger::consume_claimable_by_shares(const Address& account, const Asset& asset, U128 shares) {
    RedeemKey key{account, asset};
    ClaimableRedeem record = claimable(account, asset);

    U128 assets;
    if (shares == record.shares) {
        assets = record.assets;
    } else if (shares > record.shares) {
        throw VaultError(errors::INSUFFICIENT_CLAIMABLE_SHARES,
                         math::to_string(shares) + " > " + math::to_string(record.shares));
    } else {
        // Round down: the holder never receives more than the locked ratio
        assets = *math::mul_div(shares, record.assets, record.shares);
    }

    decrease_claimable(key, record, assets, shares);
    return assets;
}

void RedeemLedger::consume_claimable(const Address& account, const Asset& asset,
                                     U128 assets, U128 shares) {
    RedeemKey key{account, asset};
    ClaimableRedeem record = claimable(account, asset);

    if (assets > record.assets) {
        throw VaultError(errors::INSUFFICIENT_CLAIMABLE_ASSETS,
                         math::to_string(assets) + " > " + math::to_string(record.assets));
    }
    if (shares > record.shares) {
        throw VaultError(errors::INSUFFICIENT_CLAIMABLE_SHARES,
                         math::to_string(shares) + " > " + math::to_string(record.shares));
    }

    decrease_claimable(key, record, assets, shares);
}

void RedeemLedger::decrease_claimable(const RedeemKey& key, const ClaimableRedeem& current,
                                      U128 assets, U128 shares) {
    if (assets == 0 && shares == 0) return;

    ClaimableRedeem record = current;
    record.assets -= assets;
    record.shares -= shares;

    AssetTotals totals = asset_totals(key.asset);
    totals.claimable_assets -= assets;
    totals.claimable_shares -= shares;

    store_claimable(key, record);
    store_totals(key.asset, totals);
}

// =============================================================================
// Queries
// =============================================================================

PendingRedeem RedeemLedger::pending(const Address& account, const Asset& asset) const {
    auto it = pending_.find(RedeemKey{account, asset});
    return it == pending_.end() ? PendingRedeem{} : it->second;
}

ClaimableRedeem RedeemLedger::claimable(const Address& account, const Asset& asset) const {
    auto it = claimable_.find(RedeemKey{account, asset});
    return it == claimable_.end() ? ClaimableRedeem{} : it->second;
}

RedeemLedger::AssetTotals RedeemLedger::asset_totals(const Asset& asset) const {
    auto it = totals_.find(asset);
    return it == totals_.end() ? AssetTotals{} : it->second;
}

std::vector<Asset> RedeemLedger::claimable_assets() const {
    std::vector<Asset> assets;
    for (const auto& [asset, totals] : totals_) {
        if (totals.claimable_assets > 0) assets.push_back(asset);
    }
    return assets;
}

} // namespace avault
