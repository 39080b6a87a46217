#ifndef AVAULT_MEMORY_HPP
#define AVAULT_MEMORY_HPP

#include <unordered_map>
#include <set>
#include <utility>
#include <vector>

#include "types.hpp"
#include "collaborators.hpp"

namespace avault {

// =============================================================================
// In-Memory Collaborators
//
// Reference implementations of the host interfaces, used by the simulator and
// the tests. Failures throw VaultError like the core does.
// =============================================================================

// Fixed X18 rate per asset: underlying = amount * rate / 1e18
class TableRateProvider : public RateProvider {
public:
    void set_rate(const Asset& asset, U128 rate_x18);
    void remove(const Asset& asset);

    U128 convert_to_underlying(const Asset& asset, U128 amount) const override;
    U128 convert_from_underlying(const Asset& asset, U128 amount) const override;
    bool is_supported(const Asset& asset) const override;

private:
    std::unordered_map<Asset, U128, AssetHash> rates_;

    U128 rate(const Asset& asset) const;
};

class MemoryShareToken : public ShareToken {
public:
    U128 balance_of(const Address& holder) const override;
    U128 total_supply() const override { return total_supply_; }

    void transfer(const Address& from, const Address& to, U128 amount) override;
    void mint(const Address& to, U128 amount) override;
    void burn(const Address& from, U128 amount) override;

    U128 total_minted() const { return total_minted_; }
    U128 total_burned() const { return total_burned_; }

private:
    std::unordered_map<Address, U128, AddressHash> balances_;
    U128 total_supply_ = 0;
    U128 total_minted_ = 0;
    U128 total_burned_ = 0;
};

// Per-(holder, asset) balances. Values the vault's own balances for
// HoldingsSource: the canonical asset 1:1, others through the rate provider.
class MemoryAssetBook : public AssetTransfer, public HoldingsSource {
public:
    MemoryAssetBook(const RateProvider& rates, const Address& vault, const Asset& canonical);

    void credit(const Address& holder, const Asset& asset, U128 amount);
    U128 balance_of(const Address& holder, const Asset& asset) const;

    void transfer(const Asset& asset, const Address& from, const Address& to, U128 amount) override;
    void transfer_from(const Asset& asset, const Address& from, const Address& to, U128 amount) override;

    U128 gross_assets() const override;

private:
    const RateProvider& rates_;
    Address vault_;
    Asset canonical_;
    std::unordered_map<RedeemKey, U128, RedeemKeyHash> balances_;
    std::vector<Asset> known_assets_;

    void move(const Asset& asset, const Address& from, const Address& to, U128 amount);
};

class MemoryAccessGate : public AccessGate {
public:
    void grant_role(Role role, const Address& account);
    void revoke_role(Role role, const Address& account);

    // ERC-7540 style operator approval: operator may act for controller
    void set_operator(const Address& controller, const Address& op, bool approved);

    bool is_authorized(const Address& controller, const Address& caller) const override;
    bool has_role(Role role, const Address& caller) const override;

private:
    std::set<std::pair<Role, Address>> roles_;
    std::set<std::pair<Address, Address>> operators_;  // (controller, operator)
};

class MemoryPauseGate : public PauseGate {
public:
    void pause() { paused_ = true; }
    void unpause() { paused_ = false; }

    bool is_paused() const override { return paused_; }

private:
    bool paused_ = false;
};

} // namespace avault

#endif // AVAULT_MEMORY_HPP
