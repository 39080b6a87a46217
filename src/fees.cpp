// =============================================================================
// fees.cpp - FeeAccrualEngine Implementation
// =============================================================================

#include "avault/fees.hpp"
#include "avault/math.hpp"
#include <algorithm>

namespace avault {

FeeAccrualEngine::FeeAccrualEngine(const ConversionEngine& conversion)
    : conversion_(conversion) {}

U128 FeeAccrualEngine::accrued_management_fee(const Fees& fees, const Totals& totals, uint64_t now) const {
    U128 rate = fees.rates.management_fee_rate;
    if (rate == 0 || now <= fees.last_update_timestamp) return 0;

    U128 elapsed = now - fees.last_update_timestamp;
    auto rate_time = math::checked_mul(rate, elapsed);
    if (!rate_time) throw VaultError(errors::TOO_MANY_ASSETS, "management fee rate * elapsed");

    // SECONDS_PER_YEAR * 1e18 fits comfortably in 128 bits
    auto fee = math::mul_div(totals.total_assets, *rate_time, U128(SECONDS_PER_YEAR) * X18_ONE);
    if (!fee) throw VaultError(errors::TOO_MANY_ASSETS, "management fee");
    return *fee;
}

U128 FeeAccrualEngine::accrued_performance_fee(const Fees& fees, const Totals& totals) const {
    U128 rate = fees.rates.performance_fee_rate;
    if (rate == 0 || totals.share_value <= fees.high_water_mark) return 0;

    U128 gain_per_unit = totals.share_value - fees.high_water_mark;
    auto gain = math::mul_div(gain_per_unit, totals.total_supply, conversion_.share_unit());
    if (!gain) throw VaultError(errors::TOO_MANY_ASSETS, "performance gain");

    auto fee = math::mul_div(*gain, rate, X18_ONE);
    if (!fee) throw VaultError(errors::TOO_MANY_ASSETS, "performance fee");
    return *fee;
}

FeeSettlement FeeAccrualEngine::settle(const Fees& fees, const Totals& totals, uint64_t now) const {
    FeeSettlement result;
    result.management_fee = accrued_management_fee(fees, totals, now);
    result.performance_fee = accrued_performance_fee(fees, totals);

    auto total = math::checked_add(result.management_fee, result.performance_fee);
    if (!total) throw VaultError(errors::TOO_MANY_ASSETS, "total fee");

    result.fees = fees;
    result.fees.high_water_mark = std::max(fees.high_water_mark, totals.share_value);

    if (*total > 0) {
        result.fees.last_update_timestamp = now;
        result.fee_shares = conversion_.underlying_to_shares(*total, totals);
    }
    return result;
}

U128 FeeAccrualEngine::withdrawal_fee(const Fees& fees, U128 assets) const {
    if (fees.rates.withdrawal_fee_rate == 0) return 0;
    auto fee = math::mul_div_up(assets, fees.rates.withdrawal_fee_rate, X18_ONE);
    if (!fee) throw VaultError(errors::TOO_MANY_ASSETS, "withdrawal fee");
    return *fee;
}

void FeeAccrualEngine::validate(const FeeRates& rates) {
    if (rates.performance_fee_rate > fee_limits::MAX_PERFORMANCE_FEE) {
        throw VaultError(errors::INVALID_FEES, "performance fee " + x18::to_string(rates.performance_fee_rate));
    }
    if (rates.management_fee_rate > fee_limits::MAX_MANAGEMENT_FEE) {
        throw VaultError(errors::INVALID_FEES, "management fee " + x18::to_string(rates.management_fee_rate));
    }
    if (rates.withdrawal_fee_rate > fee_limits::MAX_WITHDRAWAL_FEE) {
        throw VaultError(errors::INVALID_FEES, "withdrawal fee " + x18::to_string(rates.withdrawal_fee_rate));
    }
}

} // namespace avault
