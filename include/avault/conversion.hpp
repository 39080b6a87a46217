#ifndef AVAULT_CONVERSION_HPP
#define AVAULT_CONVERSION_HPP

#include "types.hpp"
#include "collaborators.hpp"

namespace avault {

// =============================================================================
// Pure Conversions
//
// The +1 / +offset virtual amounts keep the ratio defined for an empty vault
// and make donation-based inflation attacks unprofitable. Everything rounds
// down, in the vault's favor.
// =============================================================================

namespace conversion {

// floor(shares * (total_assets + 1) / (total_supply + offset))
U128 shares_to_underlying(U128 shares, U128 total_assets, U128 total_supply, U128 offset);

// floor(assets * (total_supply + offset) / (total_assets + 1))
U128 underlying_to_shares(U128 assets, U128 total_assets, U128 total_supply, U128 offset);

} // namespace conversion

enum class Direction : uint8_t {
    TO_UNDERLYING = 0,
    FROM_UNDERLYING = 1
};

// =============================================================================
// ConversionEngine
// =============================================================================

class ConversionEngine {
public:
    // share_unit = 10^(underlying_decimals + decimals_offset)
    ConversionEngine(const RateProvider& rates, const Asset& canonical,
                     uint8_t underlying_decimals, uint8_t decimals_offset);

    U128 shares_to_underlying(U128 shares, U128 total_assets, U128 total_supply) const;
    U128 underlying_to_shares(U128 assets, U128 total_assets, U128 total_supply) const;

    U128 shares_to_underlying(U128 shares, const Totals& totals) const {
        return shares_to_underlying(shares, totals.total_assets, totals.total_supply);
    }
    U128 underlying_to_shares(U128 assets, const Totals& totals) const {
        return underlying_to_shares(assets, totals.total_assets, totals.total_supply);
    }

    // Identity for the canonical asset, RateProvider otherwise.
    // Throws ASSET_NOT_SUPPORTED for unknown assets.
    U128 convert_asset_units(const Asset& asset, U128 amount, Direction direction) const;

    U128 to_underlying(const Asset& asset, U128 amount) const {
        return convert_asset_units(asset, amount, Direction::TO_UNDERLYING);
    }
    U128 from_underlying(const Asset& asset, U128 amount) const {
        return convert_asset_units(asset, amount, Direction::FROM_UNDERLYING);
    }

    bool is_supported(const Asset& asset) const;

    // Snapshot with share_value filled in
    Totals make_totals(U128 total_assets, U128 total_supply) const;

    const Asset& canonical_asset() const { return canonical_; }
    uint8_t underlying_decimals() const { return underlying_decimals_; }
    U128 offset() const { return offset_; }
    U128 share_unit() const { return share_unit_; }

private:
    const RateProvider& rates_;
    Asset canonical_;
    uint8_t underlying_decimals_;
    U128 offset_;
    U128 share_unit_;
};

} // namespace avault

#endif // AVAULT_CONVERSION_HPP
