// =============================================================================
// types.cpp - Address formatting and error names
// =============================================================================

#include "avault/types.hpp"

namespace avault {

namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK: return "Ok";
        case INSUFFICIENT_PENDING_SHARES: return "InsufficientPendingShares";
        case INSUFFICIENT_CLAIMABLE_SHARES: return "InsufficientClaimableShares";
        case INSUFFICIENT_CLAIMABLE_ASSETS: return "InsufficientClaimableAssets";
        case TOO_MANY_SHARES: return "TooManyShares";
        case TOO_MANY_ASSETS: return "TooManyAssets";
        case NOTHING_TO_REDEEM: return "NothingToRedeem";
        case NOTHING_TO_WITHDRAW: return "NothingToWithdraw";
        case NOTHING_TO_MINT: return "NothingToMint";
        case NO_PENDING_REDEEM: return "NoPendingRedeem";
        case ASSET_NOT_SUPPORTED: return "AssetNotSupported";
        case INVALID_FEES: return "InvalidFees";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case ARRAY_LENGTH_MISMATCH: return "ArrayLengthMismatch";
        case REENTRANCY: return "Reentrancy";
        case UNAUTHORIZED: return "Unauthorized";
        case PAUSED: return "Paused";
        default: return "UnknownError";
    }
}

} // namespace errors

} // namespace avault
