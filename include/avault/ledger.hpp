#ifndef AVAULT_LEDGER_HPP
#define AVAULT_LEDGER_HPP

#include <unordered_map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace avault {

// =============================================================================
// RedeemLedger - Pending and Claimable redemption records
//
// Every mutator either applies completely or throws VaultError leaving the
// ledger untouched. Records are erased once they reach zero.
// =============================================================================

class RedeemLedger {
public:
    // Per-asset sums across all accounts; bounded like the records themselves
    struct AssetTotals {
        U128 pending_shares = 0;
        U128 claimable_assets = 0;
        U128 claimable_shares = 0;
    };

    // -------------------------------------------------------------------------
    // Journal: restores every record touched since begin() unless committed.
    // At most one journal may be open per ledger.
    // -------------------------------------------------------------------------
    class Journal {
    public:
        ~Journal();

        Journal(const Journal&) = delete;
        Journal& operator=(const Journal&) = delete;
        Journal(Journal&&) = delete;
        Journal& operator=(Journal&&) = delete;

        void commit();
        bool committed() const { return committed_; }

    private:
        friend class RedeemLedger;
        explicit Journal(RedeemLedger& ledger);

        void rollback();

        RedeemLedger& ledger_;
        bool committed_ = false;
        // First-seen value of each touched entry; nullopt = did not exist
        std::unordered_map<RedeemKey, std::optional<PendingRedeem>, RedeemKeyHash> pending_;
        std::unordered_map<RedeemKey, std::optional<ClaimableRedeem>, RedeemKeyHash> claimable_;
        std::unordered_map<Asset, std::optional<AssetTotals>, AssetHash> totals_;
    };

    RedeemLedger() = default;
    ~RedeemLedger() = default;

    RedeemLedger(const RedeemLedger&) = delete;
    RedeemLedger& operator=(const RedeemLedger&) = delete;

    // Throws std::logic_error if a journal is already open
    Journal begin();

    // =========================================================================
    // Pending
    // =========================================================================

    // Adds amount and stamps request_time. TOO_MANY_SHARES on overflow.
    void increase_pending(const Address& account, const Asset& asset, U128 amount, uint64_t now);

    // INSUFFICIENT_PENDING_SHARES if amount exceeds the record
    void consume_pending(const Address& account, const Asset& asset, U128 amount);

    // =========================================================================
    // Claimable
    // =========================================================================

    // TOO_MANY_ASSETS / TOO_MANY_SHARES, checked independently
    void increase_claimable(const Address& account, const Asset& asset, U128 assets, U128 shares);

    // Returns shares consumed: all of them when assets matches the record,
    // otherwise ceil(assets * shares / assets_stored).
    U128 consume_claimable_by_assets(const Address& account, const Asset& asset, U128 assets);

    // Returns assets released: all of them when shares matches the record,
    // otherwise floor(shares * assets_stored / shares_stored).
    U128 consume_claimable_by_shares(const Address& account, const Asset& asset, U128 shares);

    // Exact decrease of both fields
    void consume_claimable(const Address& account, const Asset& asset, U128 assets, U128 shares);

    // =========================================================================
    // Queries
    // =========================================================================

    PendingRedeem pending(const Address& account, const Asset& asset) const;
    ClaimableRedeem claimable(const Address& account, const Asset& asset) const;
    AssetTotals asset_totals(const Asset& asset) const;

    // Assets that currently have claimable assets reserved
    std::vector<Asset> claimable_assets() const;

    size_t pending_count() const { return pending_.size(); }
    size_t claimable_count() const { return claimable_.size(); }

private:
    std::unordered_map<RedeemKey, PendingRedeem, RedeemKeyHash> pending_;
    std::unordered_map<RedeemKey, ClaimableRedeem, RedeemKeyHash> claimable_;
    std::unordered_map<Asset, AssetTotals, AssetHash> totals_;

    Journal* journal_ = nullptr;

    // Journal hooks, called before the first write to an entry
    void save_pending(const RedeemKey& key);
    void save_claimable(const RedeemKey& key);
    void save_totals(const Asset& asset);

    void store_pending(const RedeemKey& key, const PendingRedeem& record);
    void store_claimable(const RedeemKey& key, const ClaimableRedeem& record);
    void store_totals(const Asset& asset, const AssetTotals& totals);

    void decrease_claimable(const RedeemKey& key, const ClaimableRedeem& current,
                            U128 assets, U128 shares);
};

} // namespace avault

#endif // AVAULT_LEDGER_HPP
