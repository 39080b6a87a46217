#ifndef AVAULT_CONFIG_HPP
#define AVAULT_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "controller.hpp"

namespace avault {

// =============================================================================
// Vault Configuration (JSON)
//
//   {
//     "vault": "0x...", "fee_recipient": "0x...", "canonical_asset": "0x...",
//     "underlying_decimals": 18, "decimals_offset": 0,
//     "fees": {"performance": "0.10", "management": "0.02", "withdrawal": "0.01"},
//     "assets": [{"address": "0x...", "rate": "1.0"}],
//     "operators": ["0x..."], "fee_managers": ["0x..."],
//     "balances": [{"holder": "0x...", "asset": "0x...", "amount": "1000"}],
//     "shares": [{"holder": "0x...", "amount": "1000"}]
//   }
//
// Addresses may also be given as small integers (addresses::from_id).
// Amounts are decimal strings or non-negative integers; rates are decimals.
// =============================================================================

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct AssetConfig {
    Asset asset;
    U128 rate = X18_ONE;    // X18 underlying per unit
};

struct BalanceConfig {
    Address holder{};
    Asset asset;
    U128 amount = 0;
};

struct ShareConfig {
    Address holder{};
    U128 amount = 0;
};

struct VaultConfig {
    Address vault{};
    Address fee_recipient{};
    Asset canonical_asset;
    uint8_t underlying_decimals = 18;
    uint8_t decimals_offset = 0;
    FeeRates fee_rates;

    std::vector<AssetConfig> assets;        // non-canonical supported assets
    std::vector<Address> operators;
    std::vector<Address> fee_managers;
    std::vector<BalanceConfig> balances;    // starting asset balances
    std::vector<ShareConfig> shares;        // starting share balances

    // Throws std::runtime_error if the file cannot be opened
    static VaultConfig from_file(std::string_view path);

    // Throws ConfigError on malformed or out-of-range values
    static VaultConfig from_json(std::string_view content);
    static VaultConfig from_document(const nlohmann::json& doc);

    ControllerConfig to_controller_config() const;
};

namespace config {

// "0x..." hex string or integer id
Address parse_address(const nlohmann::json& value, const std::string& field);

// Decimal string or non-negative integer
U128 parse_amount(const nlohmann::json& value, const std::string& field);

// Decimal string ("0.01") or number, to X18
U128 parse_rate(const nlohmann::json& value, const std::string& field);

} // namespace config

} // namespace avault

#endif // AVAULT_CONFIG_HPP
