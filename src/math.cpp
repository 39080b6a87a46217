// =============================================================================
// math.cpp - 128-bit decimal formatting and X18 parsing
// =============================================================================

#include "avault/math.hpp"
#include <algorithm>
#include <stdexcept>

namespace avault {

namespace math {

std::optional<U128> pow10(uint32_t exp) {
    // 10^38 < 2^128 < 10^39
    if (exp > 38) return std::nullopt;
    U128 result = 1;
    for (uint32_t i = 0; i < exp; ++i) result *= 10;
    return result;
}

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
        auto next = checked_mul(value, 10);
        if (!next) throw std::out_of_range("amount exceeds 128 bits: " + std::string(text));
        auto sum = checked_add(*next, static_cast<U128>(c - '0'));
        if (!sum) throw std::out_of_range("amount exceeds 128 bits: " + std::string(text));
        value = *sum;
    }
    return value;
}

} // namespace math

namespace x18 {

U128 from_string(std::string_view text) {
    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = (dot == std::string_view::npos) ? std::string_view{} : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        throw std::invalid_argument("invalid decimal: " + std::string(text));
    }
    if (frac.size() > 18) {
        throw std::invalid_argument("more than 18 decimals: " + std::string(text));
    }

    U128 int_part = whole.empty() ? 0 : math::parse_u128(whole);
    U128 frac_part = frac.empty() ? 0 : math::parse_u128(frac);
    frac_part *= *math::pow10(static_cast<uint32_t>(18 - frac.size()));

    auto scaled = math::checked_mul(int_part, X18_ONE);
    if (!scaled) throw std::out_of_range("decimal exceeds 128 bits: " + std::string(text));
    auto total = math::checked_add(*scaled, frac_part);
    if (!total) throw std::out_of_range("decimal exceeds 128 bits: " + std::string(text));
    return *total;
}

std::string to_string(U128 value) {
    std::string out = math::to_string(value / X18_ONE);
    U128 frac = value % X18_ONE;
    if (frac == 0) return out;

    std::string digits = math::to_string(frac);
    digits.insert(0, 18 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

} // namespace x18

} // namespace avault
