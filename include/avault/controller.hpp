#ifndef AVAULT_CONTROLLER_HPP
#define AVAULT_CONTROLLER_HPP

#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"
#include "collaborators.hpp"
#include "conversion.hpp"
#include "fees.hpp"
#include "ledger.hpp"

namespace avault {

// =============================================================================
// Controller Configuration
// =============================================================================

struct ControllerConfig {
    Address vault;                  // escrow for pending shares, custody for assets
    Address fee_recipient;
    Asset canonical_asset;          // the underlying accounting asset
    uint8_t underlying_decimals = 18;
    uint8_t decimals_offset = 0;    // share decimals = underlying + offset
    FeeRates fee_rates;
};

// Host services the controller composes; all must outlive it
struct Collaborators {
    ShareToken& shares;
    AssetTransfer& transfers;
    HoldingsSource& holdings;
    const RateProvider& rates;
    const AccessGate& access;
    const PauseGate& pause;
};

// =============================================================================
// Events
// =============================================================================

enum class EventType : uint8_t {
    REDEEM_REQUESTED = 0,
    REDEEM_CANCELED = 1,
    REDEEM_FULFILLED = 2,
    WITHDRAWN = 3,
    DEPOSITED = 4,
    FEES_SETTLED = 5,
    FEES_UPDATED = 6
};

const char* event_name(EventType type);

struct VaultEvent {
    EventType type;
    Address caller;
    Address controller;     // redemption controller, or deposit receiver
    Address counterparty;   // share owner / asset receiver / fee recipient
    Asset asset;
    U128 assets;
    U128 shares;
    uint64_t timestamp;
};

// =============================================================================
// RedemptionController - request / cancel / fulfill / claim orchestration
//
// Single-threaded, run-to-completion. Each mutating call:
//   - rejects re-entry (REENTRANCY),
//   - mutates ledger, fee state and counters before any collaborator
//     transfer/mint/burn,
//   - restores all of its own state if anything throws.
// =============================================================================

class RedemptionController {
public:
    using Clock = std::function<uint64_t()>;
    using EventCallback = std::function<void(const VaultEvent&)>;

    RedemptionController(const ControllerConfig& config, const Collaborators& collaborators,
                         Clock clock = system_clock_seconds);
    ~RedemptionController() = default;

    // Non-copyable
    RedemptionController(const RedemptionController&) = delete;
    RedemptionController& operator=(const RedemptionController&) = delete;

    static uint64_t system_clock_seconds();

    // =========================================================================
    // Requests (pause-gated)
    // =========================================================================

    // Escrows shares from owner into a pending redemption for controller.
    // The short form redeems into the canonical asset. Returns REQUEST_ID.
    uint64_t request_redeem(const Address& caller, U128 shares,
                            const Address& controller, const Address& owner);
    uint64_t request_redeem(const Address& caller, const Asset& asset, U128 shares,
                            const Address& controller, const Address& owner);

    // Cancels the whole pending amount; returns the shares released to receiver
    U128 cancel_redeem(const Address& caller, const Asset& asset,
                       const Address& controller, const Address& receiver);

    void cancel_redeem_partial(const Address& caller, const Asset& asset, U128 shares,
                               const Address& controller, const Address& receiver);

    // =========================================================================
    // Fulfillment (OPERATOR role, pause-gated)
    // =========================================================================

    // Returns the claimable assets credited, net of withdrawal fee
    U128 fulfill_redeem(const Address& caller, const Asset& asset, U128 shares,
                        const Address& controller);

    // All entries priced from one snapshot; all or nothing
    std::vector<U128> fulfill_redeems(const Address& caller,
                                      const std::vector<Asset>& assets,
                                      const std::vector<U128>& shares,
                                      const std::vector<Address>& controllers);

    // =========================================================================
    // Claims (never pause-gated)
    // =========================================================================

    // Returns the claimable shares consumed
    U128 withdraw(const Address& caller, const Asset& asset, U128 assets,
                  const Address& receiver, const Address& controller);

    // Returns the assets sent to receiver
    U128 redeem(const Address& caller, const Asset& asset, U128 shares,
                const Address& receiver, const Address& controller);

    // =========================================================================
    // Deposits (pause-gated)
    // =========================================================================

    // Pulls assets from caller and mints shares to receiver; returns shares
    U128 deposit(const Address& caller, const Asset& asset, U128 assets, const Address& receiver);

    // =========================================================================
    // Fees
    // =========================================================================

    // Accrues and mints outstanding fees; callable by anyone
    FeeSettlement settle_fees();

    // FEE_MANAGER role. Settles under the old rates first.
    void set_fees(const Address& caller, const FeeRates& rates);

    // =========================================================================
    // Queries
    // =========================================================================

    PendingRedeem pending(const Asset& asset, const Address& account) const;
    ClaimableRedeem claimable(const Asset& asset, const Address& account) const;
    U128 max_withdraw(const Asset& asset, const Address& account) const;
    U128 max_redeem(const Asset& asset, const Address& account) const;

    // Live snapshot: gross holdings less assets reserved for claimants
    Totals totals() const;

    U128 convert_to_shares(const Asset& asset, U128 assets) const;
    U128 convert_to_assets(const Asset& asset, U128 shares) const;

    const Fees& fees() const { return fees_; }
    U128 redeemed_shares() const { return redeemed_shares_; }
    const ControllerConfig& config() const { return config_; }
    const ConversionEngine& conversion() const { return conversion_; }
    const RedeemLedger& ledger() const { return ledger_; }

    void set_event_callback(EventCallback callback);

private:
    class ReentrancyGuard;
    class Transaction;

    struct FulfillEntry {
        Asset asset;
        U128 shares;
        Address controller;
    };

    ControllerConfig config_;
    ShareToken& shares_;
    AssetTransfer& transfers_;
    HoldingsSource& holdings_;
    const AccessGate& access_;
    const PauseGate& pause_;
    Clock clock_;

    ConversionEngine conversion_;
    FeeAccrualEngine fee_engine_;
    RedeemLedger ledger_;

    Fees fees_;
    U128 redeemed_shares_ = 0;   // claimable shares consumed by withdraw/redeem
    bool entered_ = false;

    EventCallback event_callback_;
    std::vector<VaultEvent> outbox_;  // published after a successful commit

    // Checks
    void require_not_paused() const;
    void require_role(Role role, const Address& caller) const;
    void require_authorized(const Address& controller, const Address& caller) const;
    void require_supported(const Asset& asset) const;

    // Settles fees against before; effects only, minting is left to the caller
    FeeSettlement accrue(const Totals& before, uint64_t now);

    // Totals as seen after the fee shares are minted
    Totals after_settlement(const Totals& before, const FeeSettlement& settlement) const;

    void mint_fee_shares(const FeeSettlement& settlement);

    std::vector<U128> fulfill_entries(const Address& caller, const std::vector<FulfillEntry>& entries);
    U128 cancel(const Address& caller, const Asset& asset, std::optional<U128> shares,
                const Address& controller, const Address& receiver);

    void record(EventType type, const Address& caller, const Address& controller,
                const Address& counterparty, const Asset& asset, U128 assets, U128 shares,
                uint64_t timestamp);
    void publish();
};

} // namespace avault

#endif // AVAULT_CONTROLLER_HPP
