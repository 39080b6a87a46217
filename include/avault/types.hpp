#ifndef AVAULT_TYPES_HPP
#define AVAULT_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>

namespace avault {

// =============================================================================
// Fixed-Width Amounts
// =============================================================================

// Every stored share/asset quantity is bounded to 128 bits.
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);

// X18 rates: 1e18 == 100%
constexpr U128 X18_ONE = 1000000000000000000ULL;

constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;

// The ledger keeps one fungible pending slot per (account, asset), so every
// request shares the same identifier.
constexpr uint64_t REQUEST_ID = 0;

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Deterministic address from a small integer (low 8 bytes, big-endian)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional 0x prefix; throws std::invalid_argument on bad input
Address from_hex(std::string_view hex);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Asset (Token Address)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }

    std::string to_hex() const { return addresses::to_hex(addr); }
};

struct AssetHash {
    size_t operator()(const Asset& a) const { return AddressHash{}(a.addr); }
};

// =============================================================================
// Redemption Records
// =============================================================================

// Composite (account, asset) key for the redemption maps
struct RedeemKey {
    Address account;
    Asset asset;

    bool operator==(const RedeemKey& other) const {
        return account == other.account && asset == other.asset;
    }
};

struct RedeemKeyHash {
    size_t operator()(const RedeemKey& k) const {
        uint64_t h = AddressHash{}(k.account);
        for (uint8_t b : k.asset.addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

struct PendingRedeem {
    U128 shares = 0;
    uint64_t request_time = 0;
};

// (assets, shares) locks the exchange ratio fixed at fulfillment
struct ClaimableRedeem {
    U128 assets = 0;
    U128 shares = 0;
};

// =============================================================================
// Fees & Totals
// =============================================================================

struct FeeRates {
    U128 performance_fee_rate = 0;   // X18, charged on gain above the HWM
    U128 management_fee_rate = 0;    // X18 per year, on total assets
    U128 withdrawal_fee_rate = 0;    // X18, on fulfilled asset amounts
};

struct Fees {
    FeeRates rates;
    uint64_t last_update_timestamp = 0;
    U128 high_water_mark = 0;        // share value at last settlement
};

// Hard ceilings enforced by FeeAccrualEngine::validate
namespace fee_limits {
constexpr U128 MAX_PERFORMANCE_FEE = X18_ONE / 2;    // 50%
constexpr U128 MAX_MANAGEMENT_FEE = X18_ONE / 20;    // 5% per year
constexpr U128 MAX_WITHDRAWAL_FEE = X18_ONE / 20;    // 5%
}

// Ephemeral pricing snapshot; never stored
struct Totals {
    U128 total_assets = 0;   // underlying units
    U128 total_supply = 0;   // shares
    U128 share_value = 0;    // underlying per share_unit shares
};

// =============================================================================
// Roles (operator-gated calls)
// =============================================================================

enum class Role : uint8_t {
    OPERATOR = 0,       // fulfill_redeem / fulfill_redeems
    FEE_MANAGER = 1     // set_fees
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INSUFFICIENT_PENDING_SHARES = -1;
constexpr int32_t INSUFFICIENT_CLAIMABLE_SHARES = -2;
constexpr int32_t INSUFFICIENT_CLAIMABLE_ASSETS = -3;
constexpr int32_t TOO_MANY_SHARES = -4;
constexpr int32_t TOO_MANY_ASSETS = -5;
constexpr int32_t NOTHING_TO_REDEEM = -6;
constexpr int32_t NOTHING_TO_WITHDRAW = -7;
constexpr int32_t NOTHING_TO_MINT = -8;
constexpr int32_t NO_PENDING_REDEEM = -9;
constexpr int32_t ASSET_NOT_SUPPORTED = -10;
constexpr int32_t INVALID_FEES = -11;
constexpr int32_t INSUFFICIENT_BALANCE = -20;
constexpr int32_t ARRAY_LENGTH_MISMATCH = -21;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t PAUSED = -41;

// Symbolic name of a code, e.g. "InsufficientPendingShares"
const char* message(int32_t code);
}

class VaultError : public std::runtime_error {
public:
    explicit VaultError(int32_t code)
        : std::runtime_error(errors::message(code)), code_(code) {}
    VaultError(int32_t code, const std::string& detail)
        : std::runtime_error(std::string(errors::message(code)) + ": " + detail), code_(code) {}

    int32_t code() const { return code_; }

private:
    int32_t code_;
};

} // namespace avault

#endif // AVAULT_TYPES_HPP
