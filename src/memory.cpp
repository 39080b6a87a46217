// =============================================================================
// memory.cpp - In-Memory Collaborators
// =============================================================================

#include "avault/memory.hpp"
#include "avault/math.hpp"
#include <algorithm>

namespace avault {

// =============================================================================
// TableRateProvider
// =============================================================================

void TableRateProvider::set_rate(const Asset& asset, U128 rate_x18) {
    if (rate_x18 == 0) {
        throw std::invalid_argument("rate must be nonzero for " + asset.to_hex());
    }
    rates_[asset] = rate_x18;
}

void TableRateProvider::remove(const Asset& asset) {
    rates_.erase(asset);
}

U128 TableRateProvider::rate(const Asset& asset) const {
    auto it = rates_.find(asset);
    if (it == rates_.end()) {
        throw VaultError(errors::ASSET_NOT_SUPPORTED, asset.to_hex());
    }
    return it->second;
}

U128 TableRateProvider::convert_to_underlying(const Asset& asset, U128 amount) const {
    auto result = math::mul_div(amount, rate(asset), X18_ONE);
    if (!result) throw VaultError(errors::TOO_MANY_ASSETS, "rate conversion");
    return *result;
}

U128 TableRateProvider::convert_from_underlying(const Asset& asset, U128 amount) const {
    auto result = math::mul_div(amount, X18_ONE, rate(asset));
    if (!result) throw VaultError(errors::TOO_MANY_ASSETS, "rate conversion");
    return *result;
}

bool TableRateProvider::is_supported(const Asset& asset) const {
    return rates_.find(asset) != rates_.end();
}

// =============================================================================
// MemoryShareToken
// =============================================================================

U128 MemoryShareToken::balance_of(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

void MemoryShareToken::transfer(const Address& from, const Address& to, U128 amount) {
    U128 from_balance = balance_of(from);
    if (from_balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE, "share transfer from " + addresses::to_hex(from));
    }
    if (amount == 0 || from == to) return;

    // to's balance is bounded by total supply, so no overflow check is needed
    balances_[from] = from_balance - amount;
    balances_[to] += amount;
}

void MemoryShareToken::mint(const Address& to, U128 amount) {
    auto supply = math::checked_add(total_supply_, amount);
    auto minted = math::checked_add(total_minted_, amount);
    if (!supply || !minted) throw VaultError(errors::TOO_MANY_SHARES, "share mint");

    total_supply_ = *supply;
    total_minted_ = *minted;
    balances_[to] += amount;
}

void MemoryShareToken::burn(const Address& from, U128 amount) {
    U128 balance = balance_of(from);
    if (balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE, "share burn from " + addresses::to_hex(from));
    }
    balances_[from] = balance - amount;
    total_supply_ -= amount;
    total_burned_ += amount;
}

// =============================================================================
// MemoryAssetBook
// =============================================================================

MemoryAssetBook::MemoryAssetBook(const RateProvider& rates, const Address& vault, const Asset& canonical)
    : rates_(rates), vault_(vault), canonical_(canonical) {}

void MemoryAssetBook::credit(const Address& holder, const Asset& asset, U128 amount) {
    RedeemKey key{holder, asset};
    auto balance = math::checked_add(balances_[key], amount);
    if (!balance) throw VaultError(errors::TOO_MANY_ASSETS, "asset credit");
    balances_[key] = *balance;

    if (std::find(known_assets_.begin(), known_assets_.end(), asset) == known_assets_.end()) {
        known_assets_.push_back(asset);
    }
}

U128 MemoryAssetBook::balance_of(const Address& holder, const Asset& asset) const {
    auto it = balances_.find(RedeemKey{holder, asset});
    return it == balances_.end() ? 0 : it->second;
}

void MemoryAssetBook::transfer(const Asset& asset, const Address& from, const Address& to, U128 amount) {
    move(asset, from, to, amount);
}

void MemoryAssetBook::transfer_from(const Asset& asset, const Address& from, const Address& to, U128 amount) {
    // Allowances are not modelled; every holder has approved the vault
    move(asset, from, to, amount);
}

void MemoryAssetBook::move(const Asset& asset, const Address& from, const Address& to, U128 amount) {
    U128 from_balance = balance_of(from, asset);
    if (from_balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE,
                         asset.to_hex() + " from " + addresses::to_hex(from) + ": "
                         + math::to_string(amount) + " > " + math::to_string(from_balance));
    }
    if (amount == 0 || from == to) return;

    auto to_balance = math::checked_add(balance_of(to, asset), amount);
    if (!to_balance) throw VaultError(errors::TOO_MANY_ASSETS, "asset transfer");

    balances_[RedeemKey{from, asset}] = from_balance - amount;
    balances_[RedeemKey{to, asset}] = *to_balance;

    if (std::find(known_assets_.begin(), known_assets_.end(), asset) == known_assets_.end()) {
        known_assets_.push_back(asset);
    }
}

U128 MemoryAssetBook::gross_assets() const {
    U128 total = 0;
    for (const Asset& asset : known_assets_) {
        U128 balance = balance_of(vault_, asset);
        if (balance == 0) continue;

        U128 value = 0;
        if (asset == canonical_) {
            value = balance;
        } else if (rates_.is_supported(asset)) {
            value = rates_.convert_to_underlying(asset, balance);
        } else {
            continue;  // unpriced holdings carry no value
        }

        auto sum = math::checked_add(total, value);
        if (!sum) throw VaultError(errors::TOO_MANY_ASSETS, "gross assets");
        total = *sum;
    }
    return total;
}

// =============================================================================
// MemoryAccessGate
// =============================================================================

void MemoryAccessGate::grant_role(Role role, const Address& account) {
    roles_.insert({role, account});
}

void MemoryAccessGate::revoke_role(Role role, const Address& account) {
    roles_.erase({role, account});
}

void MemoryAccessGate::set_operator(const Address& controller, const Address& op, bool approved) {
    if (approved) {
        operators_.insert({controller, op});
    } else {
        operators_.erase({controller, op});
    }
}

bool MemoryAccessGate::is_authorized(const Address& controller, const Address& caller) const {
    return controller == caller || operators_.count({controller, caller}) > 0;
}

bool MemoryAccessGate::has_role(Role role, const Address& caller) const {
    return roles_.count({role, caller}) > 0;
}

} // namespace avault
