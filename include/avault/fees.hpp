#ifndef AVAULT_FEES_HPP
#define AVAULT_FEES_HPP

#include "types.hpp"
#include "conversion.hpp"

namespace avault {

// =============================================================================
// Settlement Result
// =============================================================================

struct FeeSettlement {
    U128 management_fee = 0;    // underlying
    U128 performance_fee = 0;   // underlying
    U128 fee_shares = 0;        // shares to mint to the fee recipient
    Fees fees;                  // updated HWM / timestamp

    U128 total_fee() const { return management_fee + performance_fee; }
};

// =============================================================================
// FeeAccrualEngine - management / performance / withdrawal fees
//
// Management fee accrues linearly on total assets. Performance fee is charged
// on the whole supply's gain above a single global high-water mark.
// =============================================================================

class FeeAccrualEngine {
public:
    explicit FeeAccrualEngine(const ConversionEngine& conversion);

    // rate * total_assets * elapsed / SECONDS_PER_YEAR / 1e18
    U128 accrued_management_fee(const Fees& fees, const Totals& totals, uint64_t now) const;

    // rate * (share_value - hwm) * total_supply / share_unit / 1e18, zero at or below the HWM
    U128 accrued_performance_fee(const Fees& fees, const Totals& totals) const;

    // Both fees, the shares to mint for them, and the next Fees record.
    // The HWM always moves to max(hwm, share_value); the timestamp only
    // advances when a nonzero fee was taken.
    FeeSettlement settle(const Fees& fees, const Totals& totals, uint64_t now) const;

    // ceil(assets * withdrawal_fee_rate / 1e18)
    U128 withdrawal_fee(const Fees& fees, U128 assets) const;

    // INVALID_FEES when any rate exceeds its ceiling
    static void validate(const FeeRates& rates);

private:
    const ConversionEngine& conversion_;
};

} // namespace avault

#endif // AVAULT_FEES_HPP
