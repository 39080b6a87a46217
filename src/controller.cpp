// =============================================================================
// controller.cpp - RedemptionController Implementation
// =============================================================================

#include "avault/controller.hpp"
#include "avault/math.hpp"
#include <chrono>
#include <map>
#include <utility>

namespace avault {

const char* event_name(EventType type) {
    switch (type) {
        case EventType::REDEEM_REQUESTED: return "RedeemRequested";
        case EventType::REDEEM_CANCELED: return "RedeemCanceled";
        case EventType::REDEEM_FULFILLED: return "RedeemFulfilled";
        case EventType::WITHDRAWN: return "Withdrawn";
        case EventType::DEPOSITED: return "Deposited";
        case EventType::FEES_SETTLED: return "FeesSettled";
        case EventType::FEES_UPDATED: return "FeesUpdated";
    }
    return "Unknown";
}

// =============================================================================
// Reentrancy Guard
// =============================================================================

class RedemptionController::ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& entered) : entered_(entered) {
        if (entered_) throw VaultError(errors::REENTRANCY);
        entered_ = true;
    }
    ~ReentrancyGuard() { entered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& entered_;
};

// =============================================================================
// Transaction: ledger journal + controller scalars, restored unless committed
// =============================================================================

class RedemptionController::Transaction {
public:
    explicit Transaction(RedemptionController& controller)
        : controller_(controller)
        , journal_(controller.ledger_.begin())
        , fees_(controller.fees_)
        , redeemed_shares_(controller.redeemed_shares_)
    {}

    ~Transaction() {
        if (!journal_.committed()) {
            controller_.fees_ = fees_;
            controller_.redeemed_shares_ = redeemed_shares_;
            controller_.outbox_.clear();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() { journal_.commit(); }

private:
    RedemptionController& controller_;
    RedeemLedger::Journal journal_;
    Fees fees_;
    U128 redeemed_shares_;
};

// =============================================================================
// Constructor
// =============================================================================

RedemptionController::RedemptionController(const ControllerConfig& config,
                                           const Collaborators& collaborators,
                                           Clock clock)
    : config_(config)
    , shares_(collaborators.shares)
    , transfers_(collaborators.transfers)
    , holdings_(collaborators.holdings)
    , access_(collaborators.access)
    , pause_(collaborators.pause)
    , clock_(std::move(clock))
    , conversion_(collaborators.rates, config.canonical_asset,
                  config.underlying_decimals, config.decimals_offset)
    , fee_engine_(conversion_)
{
    FeeAccrualEngine::validate(config.fee_rates);

    fees_.rates = config.fee_rates;
    fees_.last_update_timestamp = clock_();
    fees_.high_water_mark = totals().share_value;
}

uint64_t RedemptionController::system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Requests
// =============================================================================

uint64_t RedemptionController::request_redeem(const Address& caller, U128 shares,
                                              const Address& controller, const Address& owner) {
    return request_redeem(caller, config_.canonical_asset, shares, controller, owner);
}

uint64_t RedemptionController::request_redeem(const Address& caller, const Asset& asset, U128 shares,
                                              const Address& controller, const Address& owner) {
    {
        ReentrancyGuard guard(entered_);
        require_not_paused();

        if (shares == 0) throw VaultError(errors::NOTHING_TO_REDEEM);
        require_supported(asset);
        if (caller != owner && !access_.is_authorized(owner, caller)) {
            throw VaultError(errors::UNAUTHORIZED, "caller may not spend owner's shares");
        }
        U128 balance = shares_.balance_of(owner);
        if (balance < shares) {
            throw VaultError(errors::INSUFFICIENT_BALANCE,
                             math::to_string(shares) + " > " + math::to_string(balance));
        }

        Transaction txn(*this);
        uint64_t now = clock_();

        ledger_.increase_pending(controller, asset, shares, now);
        record(EventType::REDEEM_REQUESTED, caller, controller, owner, asset, 0, shares, now);

        // Escrow
        shares_.transfer(owner, config_.vault, shares);

        txn.commit();
    }
    publish();
    return REQUEST_ID;
}

U128 RedemptionController::cancel_redeem(const Address& caller, const Asset& asset,
                                         const Address& controller, const Address& receiver) {
    return cancel(caller, asset, std::nullopt, controller, receiver);
}

void RedemptionController::cancel_redeem_partial(const Address& caller, const Asset& asset, U128 shares,
                                                 const Address& controller, const Address& receiver) {
    cancel(caller, asset, shares, controller, receiver);
}

U128 RedemptionController::cancel(const Address& caller, const Asset& asset, std::optional<U128> shares,
                                  const Address& controller, const Address& receiver) {
    U128 amount = 0;
    {
        ReentrancyGuard guard(entered_);
        require_not_paused();
        require_authorized(controller, caller);

        PendingRedeem pending = ledger_.pending(controller, asset);
        amount = shares ? *shares : pending.shares;
        if (amount == 0 || pending.shares == 0) {
            throw VaultError(errors::NO_PENDING_REDEEM);
        }

        Transaction txn(*this);
        uint64_t now = clock_();

        ledger_.consume_pending(controller, asset, amount);
        record(EventType::REDEEM_CANCELED, caller, controller, receiver, asset, 0, amount, now);

        // Release escrow
        shares_.transfer(config_.vault, receiver, amount);

        txn.commit();
    }
    publish();
    return amount;
}

// =============================================================================
// Fulfillment
// =============================================================================

U128 RedemptionController::fulfill_redeem(const Address& caller, const Asset& asset, U128 shares,
                                          const Address& controller) {
    std::vector<U128> assets = fulfill_entries(caller, {FulfillEntry{asset, shares, controller}});
    return assets.front();
}

std::vector<U128> RedemptionController::fulfill_redeems(const Address& caller,
                                                        const std::vector<Asset>& assets,
                                                        const std::vector<U128>& shares,
                                                        const std::vector<Address>& controllers) {
    if (assets.size() != shares.size() || assets.size() != controllers.size()) {
        throw VaultError(errors::ARRAY_LENGTH_MISMATCH);
    }

    std::vector<FulfillEntry> entries;
    entries.reserve(assets.size());
    for (size_t i = 0; i < assets.size(); ++i) {
        entries.push_back(FulfillEntry{assets[i], shares[i], controllers[i]});
    }
    return fulfill_entries(caller, entries);
}

std::vector<U128> RedemptionController::fulfill_entries(const Address& caller,
                                                        const std::vector<FulfillEntry>& entries) {
    std::vector<U128> fulfilled;
    {
        ReentrancyGuard guard(entered_);
        require_not_paused();
        require_role(Role::OPERATOR, caller);

        Transaction txn(*this);
        uint64_t now = clock_();

        Totals before = totals();
        FeeSettlement settlement = accrue(before, now);

        // One snapshot for every entry; burning is deferred until after the
        // loop, so later entries cannot see earlier ones.
        const Totals snapshot = after_settlement(before, settlement);

        std::map<Asset, U128> withdrawal_fees;
        U128 burn_total = 0;
        fulfilled.reserve(entries.size());

        for (const FulfillEntry& entry : entries) {
            if (entry.shares == 0) throw VaultError(errors::NOTHING_TO_REDEEM);
            require_supported(entry.asset);

            U128 underlying = conversion_.shares_to_underlying(entry.shares, snapshot);
            U128 assets = conversion_.from_underlying(entry.asset, underlying);
            U128 fee = fee_engine_.withdrawal_fee(fees_, assets);
            U128 net = math::saturating_sub(assets, fee);
            if (net == 0) throw VaultError(errors::NOTHING_TO_WITHDRAW);

            ledger_.consume_pending(entry.controller, entry.asset, entry.shares);
            ledger_.increase_claimable(entry.controller, entry.asset, net, entry.shares);

            auto fee_sum = math::checked_add(withdrawal_fees[entry.asset], fee);
            if (!fee_sum) throw VaultError(errors::TOO_MANY_ASSETS, "withdrawal fees");
            withdrawal_fees[entry.asset] = *fee_sum;

            auto burn_sum = math::checked_add(burn_total, entry.shares);
            if (!burn_sum) throw VaultError(errors::TOO_MANY_SHARES, "fulfilled shares");
            burn_total = *burn_sum;

            fulfilled.push_back(net);
            record(EventType::REDEEM_FULFILLED, caller, entry.controller, config_.vault,
                   entry.asset, net, entry.shares, now);
        }

        // Asset transfers are the calls that can fail on balance; run them
        // before touching the share token
        for (const auto& [asset, fee] : withdrawal_fees) {
            if (fee > 0) transfers_.transfer(asset, config_.vault, config_.fee_recipient, fee);
        }
        if (burn_total > 0) shares_.burn(config_.vault, burn_total);
        mint_fee_shares(settlement);

        txn.commit();
    }
    publish();
    return fulfilled;
}

// =============================================================================
// Claims
// =============================================================================

U128 RedemptionController::withdraw(const Address& caller, const Asset& asset, U128 assets,
                                    const Address& receiver, const Address& controller) {
    U128 shares = 0;
    {
        ReentrancyGuard guard(entered_);
        if (assets == 0) throw VaultError(errors::NOTHING_TO_WITHDRAW);
        require_authorized(controller, caller);

        Transaction txn(*this);
        uint64_t now = clock_();

        shares = ledger_.consume_claimable_by_assets(controller, asset, assets);
        auto redeemed = math::checked_add(redeemed_shares_, shares);
        if (!redeemed) throw VaultError(errors::TOO_MANY_SHARES, "redeemed shares");
        redeemed_shares_ = *redeemed;
        record(EventType::WITHDRAWN, caller, controller, receiver, asset, assets, shares, now);

        transfers_.transfer(asset, config_.vault, receiver, assets);

        txn.commit();
    }
    publish();
    return shares;
}

U128 RedemptionController::redeem(const Address& caller, const Asset& asset, U128 shares,
                                  const Address& receiver, const Address& controller) {
    U128 assets = 0;
    {
        ReentrancyGuard guard(entered_);
        if (shares == 0) throw VaultError(errors::NOTHING_TO_REDEEM);
        require_authorized(controller, caller);

        ClaimableRedeem before = ledger_.claimable(controller, asset);

        Transaction txn(*this);
        uint64_t now = clock_();

        assets = ledger_.consume_claimable_by_shares(controller, asset, shares);
        // A partial redeem that rounds to nothing would burn shares for free
        if (assets == 0 && shares != before.shares) {
            throw VaultError(errors::NOTHING_TO_WITHDRAW);
        }
        auto redeemed = math::checked_add(redeemed_shares_, shares);
        if (!redeemed) throw VaultError(errors::TOO_MANY_SHARES, "redeemed shares");
        redeemed_shares_ = *redeemed;
        record(EventType::WITHDRAWN, caller, controller, receiver, asset, assets, shares, now);

        if (assets > 0) transfers_.transfer(asset, config_.vault, receiver, assets);

        txn.commit();
    }
    publish();
    return assets;
}

// =============================================================================
// Deposits
// =============================================================================

U128 RedemptionController::deposit(const Address& caller, const Asset& asset, U128 assets,
                                   const Address& receiver) {
    U128 minted = 0;
    {
        ReentrancyGuard guard(entered_);
        require_not_paused();
        require_supported(asset);

        Transaction txn(*this);
        uint64_t now = clock_();

        Totals before = totals();
        FeeSettlement settlement = accrue(before, now);
        const Totals snapshot = after_settlement(before, settlement);

        U128 underlying = conversion_.to_underlying(asset, assets);
        minted = conversion_.underlying_to_shares(underlying, snapshot);
        if (minted == 0) throw VaultError(errors::NOTHING_TO_MINT);
        // Checked before assets move so the mint below cannot overflow
        if (!math::checked_add(snapshot.total_supply, minted)) {
            throw VaultError(errors::TOO_MANY_SHARES, "total supply + minted shares");
        }

        record(EventType::DEPOSITED, caller, receiver, caller, asset, assets, minted, now);

        transfers_.transfer_from(asset, caller, config_.vault, assets);
        mint_fee_shares(settlement);
        shares_.mint(receiver, minted);

        txn.commit();
    }
    publish();
    return minted;
}

// =============================================================================
// Fees
// =============================================================================

FeeSettlement RedemptionController::settle_fees() {
    FeeSettlement settlement;
    {
        ReentrancyGuard guard(entered_);
        Transaction txn(*this);

        settlement = accrue(totals(), clock_());
        mint_fee_shares(settlement);

        txn.commit();
    }
    publish();
    return settlement;
}

void RedemptionController::set_fees(const Address& caller, const FeeRates& rates) {
    {
        ReentrancyGuard guard(entered_);
        require_role(Role::FEE_MANAGER, caller);
        FeeAccrualEngine::validate(rates);

        Transaction txn(*this);
        uint64_t now = clock_();

        FeeSettlement settlement = accrue(totals(), now);
        fees_.rates = rates;
        fees_.last_update_timestamp = now;
        record(EventType::FEES_UPDATED, caller, caller, config_.fee_recipient,
               config_.canonical_asset, 0, 0, now);

        mint_fee_shares(settlement);

        txn.commit();
    }
    publish();
}

FeeSettlement RedemptionController::accrue(const Totals& before, uint64_t now) {
    FeeSettlement settlement = fee_engine_.settle(fees_, before, now);
    fees_ = settlement.fees;
    if (settlement.total_fee() > 0) {
        record(EventType::FEES_SETTLED, config_.fee_recipient, config_.fee_recipient,
               config_.fee_recipient, config_.canonical_asset, settlement.total_fee(),
               settlement.fee_shares, now);
    }
    return settlement;
}

Totals RedemptionController::after_settlement(const Totals& before, const FeeSettlement& settlement) const {
    if (settlement.fee_shares == 0) return before;
    auto supply = math::checked_add(before.total_supply, settlement.fee_shares);
    if (!supply) throw VaultError(errors::TOO_MANY_SHARES, "total supply + fee shares");
    return conversion_.make_totals(before.total_assets, *supply);
}

void RedemptionController::mint_fee_shares(const FeeSettlement& settlement) {
    if (settlement.fee_shares > 0) {
        shares_.mint(config_.fee_recipient, settlement.fee_shares);
    }
}

// =============================================================================
// Queries
// =============================================================================

PendingRedeem RedemptionController::pending(const Asset& asset, const Address& account) const {
    return ledger_.pending(account, asset);
}

ClaimableRedeem RedemptionController::claimable(const Asset& asset, const Address& account) const {
    return ledger_.claimable(account, asset);
}

U128 RedemptionController::max_withdraw(const Asset& asset, const Address& account) const {
    return ledger_.claimable(account, asset).assets;
}

U128 RedemptionController::max_redeem(const Asset& asset, const Address& account) const {
    return ledger_.claimable(account, asset).shares;
}

Totals RedemptionController::totals() const {
    U128 reserved = 0;
    for (const Asset& asset : ledger_.claimable_assets()) {
        // Unpriced holdings are left out of gross_assets too
        if (!conversion_.is_supported(asset)) continue;
        U128 value = conversion_.to_underlying(asset, ledger_.asset_totals(asset).claimable_assets);
        auto sum = math::checked_add(reserved, value);
        if (!sum) throw VaultError(errors::TOO_MANY_ASSETS, "reserved assets");
        reserved = *sum;
    }
    U128 net = math::saturating_sub(holdings_.gross_assets(), reserved);
    return conversion_.make_totals(net, shares_.total_supply());
}

U128 RedemptionController::convert_to_shares(const Asset& asset, U128 assets) const {
    return conversion_.underlying_to_shares(conversion_.to_underlying(asset, assets), totals());
}

U128 RedemptionController::convert_to_assets(const Asset& asset, U128 shares) const {
    return conversion_.from_underlying(asset, conversion_.shares_to_underlying(shares, totals()));
}

void RedemptionController::set_event_callback(EventCallback callback) {
    event_callback_ = std::move(callback);
}

// =============================================================================
// Checks & Events
// =============================================================================

void RedemptionController::require_not_paused() const {
    if (pause_.is_paused()) throw VaultError(errors::PAUSED);
}

void RedemptionController::require_role(Role role, const Address& caller) const {
    if (!access_.has_role(role, caller)) {
        throw VaultError(errors::UNAUTHORIZED, addresses::to_hex(caller) + " lacks role");
    }
}

void RedemptionController::require_authorized(const Address& controller, const Address& caller) const {
    if (caller != controller && !access_.is_authorized(controller, caller)) {
        throw VaultError(errors::UNAUTHORIZED, addresses::to_hex(caller) + " is not an operator of "
                         + addresses::to_hex(controller));
    }
}

void RedemptionController::require_supported(const Asset& asset) const {
    if (!conversion_.is_supported(asset)) {
        throw VaultError(errors::ASSET_NOT_SUPPORTED, asset.to_hex());
    }
}

void RedemptionController::record(EventType type, const Address& caller, const Address& controller,
                                  const Address& counterparty, const Asset& asset, U128 assets,
                                  U128 shares, uint64_t timestamp) {
    outbox_.push_back(VaultEvent{type, caller, controller, counterparty, asset, assets, shares, timestamp});
}

void RedemptionController::publish() {
    std::vector<VaultEvent> events;
    events.swap(outbox_);
    if (!event_callback_) return;
    for (const auto& event : events) event_callback_(event);
}

} // namespace avault
