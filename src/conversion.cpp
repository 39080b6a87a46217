// =============================================================================
// conversion.cpp - Share / underlying / asset-unit conversions
// =============================================================================

#include "avault/conversion.hpp"
#include "avault/math.hpp"

namespace avault {

namespace conversion {

U128 shares_to_underlying(U128 shares, U128 total_assets, U128 total_supply, U128 offset) {
    auto denom = math::checked_add(total_supply, offset);
    if (!denom) throw VaultError(errors::TOO_MANY_SHARES, "total supply + offset");

    // shares * (total_assets + 1) without materializing total_assets + 1
    math::U256 num = math::add_u128(math::mul_u128(shares, total_assets), shares);
    auto assets = math::div_floor(num, *denom);
    if (!assets) throw VaultError(errors::TOO_MANY_ASSETS, "shares_to_underlying");
    return *assets;
}

U128 underlying_to_shares(U128 assets, U128 total_assets, U128 total_supply, U128 offset) {
    auto supply = math::checked_add(total_supply, offset);
    if (!supply) throw VaultError(errors::TOO_MANY_SHARES, "total supply + offset");
    auto denom = math::checked_add(total_assets, 1);
    if (!denom) throw VaultError(errors::TOO_MANY_ASSETS, "total assets + 1");

    auto shares = math::mul_div(assets, *supply, *denom);
    if (!shares) throw VaultError(errors::TOO_MANY_SHARES, "underlying_to_shares");
    return *shares;
}

} // namespace conversion

// =============================================================================
// ConversionEngine
// =============================================================================

ConversionEngine::ConversionEngine(const RateProvider& rates, const Asset& canonical,
                                   uint8_t underlying_decimals, uint8_t decimals_offset)
    : rates_(rates)
    , canonical_(canonical)
    , underlying_decimals_(underlying_decimals)
{
    auto offset = math::pow10(decimals_offset);
    auto unit = math::pow10(static_cast<uint32_t>(underlying_decimals) + decimals_offset);
    if (!offset || !unit) {
        throw std::invalid_argument("underlying_decimals + decimals_offset must be <= 38");
    }
    offset_ = *offset;
    share_unit_ = *unit;
}

U128 ConversionEngine::shares_to_underlying(U128 shares, U128 total_assets, U128 total_supply) const {
    return conversion::shares_to_underlying(shares, total_assets, total_supply, offset_);
}

U128 ConversionEngine::underlying_to_shares(U128 assets, U128 total_assets, U128 total_supply) const {
    return conversion::underlying_to_shares(assets, total_assets, total_supply, offset_);
}

U128 ConversionEngine::convert_asset_units(const Asset& asset, U128 amount, Direction direction) const {
    if (asset == canonical_) return amount;

    if (!rates_.is_supported(asset)) {
        throw VaultError(errors::ASSET_NOT_SUPPORTED, asset.to_hex());
    }
    return direction == Direction::TO_UNDERLYING
        ? rates_.convert_to_underlying(asset, amount)
        : rates_.convert_from_underlying(asset, amount);
}

bool ConversionEngine::is_supported(const Asset& asset) const {
    return asset == canonical_ || rates_.is_supported(asset);
}

Totals ConversionEngine::make_totals(U128 total_assets, U128 total_supply) const {
    Totals totals;
    totals.total_assets = total_assets;
    totals.total_supply = total_supply;
    totals.share_value = shares_to_underlying(share_unit_, total_assets, total_supply);
    return totals;
}

} // namespace avault
