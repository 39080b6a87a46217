// =============================================================================
// config.cpp - Vault Configuration Loader
// =============================================================================

#include "avault/config.hpp"
#include "avault/math.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <sstream>

namespace avault {

using json = nlohmann::json;

namespace config {

namespace {

// JSON integers built in code are signed; parsed ones are unsigned
std::optional<uint64_t> non_negative_integer(const json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    return std::nullopt;
}

}  // namespace

Address parse_address(const json& value, const std::string& field) {
    if (auto id = non_negative_integer(value)) {
        return addresses::from_id(*id);
    }
    if (!value.is_string()) {
        throw ConfigError(field + ": expected address string or id");
    }
    try {
        return addresses::from_hex(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(field + ": " + e.what());
    }
}

U128 parse_amount(const json& value, const std::string& field) {
    if (auto amount = non_negative_integer(value)) {
        return *amount;
    }
    if (!value.is_string()) {
        throw ConfigError(field + ": expected amount string or non-negative integer");
    }
    try {
        return math::parse_u128(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(field + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw ConfigError(field + ": " + e.what());
    }
}

U128 parse_rate(const json& value, const std::string& field) {
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number()) {
        text = value.dump();
    } else {
        throw ConfigError(field + ": expected decimal rate");
    }
    try {
        return x18::from_string(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(field + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw ConfigError(field + ": " + e.what());
    }
}

} // namespace config

namespace {

uint8_t parse_decimals(const json& doc, const char* key, uint8_t fallback) {
    if (!doc.contains(key)) return fallback;
    auto value = config::non_negative_integer(doc[key]);
    if (!value || *value > 38) {
        throw ConfigError(std::string(key) + ": expected integer in [0, 38]");
    }
    return static_cast<uint8_t>(*value);
}

const json& require(const json& doc, const char* key) {
    if (!doc.contains(key)) {
        throw ConfigError(std::string("missing field: ") + key);
    }
    return doc[key];
}

const json& array_or_empty(const json& doc, const char* key) {
    static const json empty = json::array();
    if (!doc.contains(key)) return empty;
    const json& value = doc[key];
    if (!value.is_array()) {
        throw ConfigError(std::string(key) + ": expected array");
    }
    return value;
}

}  // namespace

VaultConfig VaultConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

VaultConfig VaultConfig::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return from_document(doc);
}

VaultConfig VaultConfig::from_document(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("config root must be an object");
    }

    VaultConfig cfg;
    cfg.vault = config::parse_address(require(doc, "vault"), "vault");
    cfg.fee_recipient = config::parse_address(require(doc, "fee_recipient"), "fee_recipient");
    cfg.canonical_asset = Asset(config::parse_address(require(doc, "canonical_asset"), "canonical_asset"));
    cfg.underlying_decimals = parse_decimals(doc, "underlying_decimals", cfg.underlying_decimals);
    cfg.decimals_offset = parse_decimals(doc, "decimals_offset", cfg.decimals_offset);
    if (cfg.underlying_decimals + cfg.decimals_offset > 38) {
        throw ConfigError("underlying_decimals + decimals_offset exceeds 38");
    }

    if (doc.contains("fees")) {
        const json& fees = doc["fees"];
        if (!fees.is_object()) throw ConfigError("fees: expected object");
        if (fees.contains("performance")) {
            cfg.fee_rates.performance_fee_rate = config::parse_rate(fees["performance"], "fees.performance");
        }
        if (fees.contains("management")) {
            cfg.fee_rates.management_fee_rate = config::parse_rate(fees["management"], "fees.management");
        }
        if (fees.contains("withdrawal")) {
            cfg.fee_rates.withdrawal_fee_rate = config::parse_rate(fees["withdrawal"], "fees.withdrawal");
        }
    }

    for (const auto& a : array_or_empty(doc, "assets")) {
        AssetConfig asset;
        asset.asset = Asset(config::parse_address(require(a, "address"), "assets.address"));
        if (a.contains("rate")) asset.rate = config::parse_rate(a["rate"], "assets.rate");
        if (asset.rate == 0) throw ConfigError("assets.rate: must be nonzero");
        if (asset.asset == cfg.canonical_asset) {
            throw ConfigError("assets: canonical asset is implicitly supported");
        }
        cfg.assets.push_back(asset);
    }

    for (const auto& op : array_or_empty(doc, "operators")) {
        cfg.operators.push_back(config::parse_address(op, "operators"));
    }
    for (const auto& fm : array_or_empty(doc, "fee_managers")) {
        cfg.fee_managers.push_back(config::parse_address(fm, "fee_managers"));
    }

    for (const auto& b : array_or_empty(doc, "balances")) {
        BalanceConfig balance;
        balance.holder = config::parse_address(require(b, "holder"), "balances.holder");
        balance.asset = Asset(config::parse_address(require(b, "asset"), "balances.asset"));
        balance.amount = config::parse_amount(require(b, "amount"), "balances.amount");
        cfg.balances.push_back(balance);
    }

    for (const auto& s : array_or_empty(doc, "shares")) {
        ShareConfig share;
        share.holder = config::parse_address(require(s, "holder"), "shares.holder");
        share.amount = config::parse_amount(require(s, "amount"), "shares.amount");
        cfg.shares.push_back(share);
    }

    return cfg;
}

ControllerConfig VaultConfig::to_controller_config() const {
    ControllerConfig out;
    out.vault = vault;
    out.fee_recipient = fee_recipient;
    out.canonical_asset = canonical_asset;
    out.underlying_decimals = underlying_decimals;
    out.decimals_offset = decimals_offset;
    out.fee_rates = fee_rates;
    return out;
}

}  // namespace avault
