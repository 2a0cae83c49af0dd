// =============================================================================
// types.cpp - X18 decimal codec, pair canonicalization, record helpers
// =============================================================================

#include "dataswap/types.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/math.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace dataswap {

namespace x18 {

namespace {

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

[[noreturn]] void bad_amount(const std::string& s, const char* why) {
    throw Error(ErrorCode::InvalidAmount, "invalid amount '" + s + "': " + why);
}

} // anonymous namespace

I128 from_string(const std::string& s) {
    if (s.empty()) bad_amount(s, "empty");

    size_t pos = 0;
    if (s[0] == '-') bad_amount(s, "negative");
    if (s[0] == '+') pos = 1;

    I128 whole = 0;
    size_t whole_digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        I128 digit = s[pos] - '0';
        if (whole > (I128_MAX / X18_ONE - digit) / 10) bad_amount(s, "out of range");
        whole = whole * 10 + digit;
        ++whole_digits;
        ++pos;
    }

    I128 frac = 0;
    size_t frac_digits = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (++frac_digits > static_cast<size_t>(X18_DECIMALS)) {
                bad_amount(s, "more than 18 decimal places");
            }
            frac = frac * 10 + (s[pos] - '0');
            ++pos;
        }
        if (frac_digits == 0 && whole_digits == 0) bad_amount(s, "no digits");
    }

    if (pos != s.size()) bad_amount(s, "unexpected character");
    if (whole_digits == 0 && frac_digits == 0) bad_amount(s, "no digits");

    for (size_t i = frac_digits; i < static_cast<size_t>(X18_DECIMALS); ++i) {
        frac *= 10;
    }
    return whole * X18_ONE + frac;
}

std::string raw_string(I128 v) {
    if (v == 0) return "0";
    bool neg = v < 0;
    U128 u = neg ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    bool neg = v < 0;
    I128 mag = math::abs128(v);
    std::string whole = raw_string(mag / X18_ONE);
    std::string frac = raw_string(mag % X18_ONE);
    frac.insert(0, static_cast<size_t>(X18_DECIMALS) - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    std::string out = neg ? "-" + whole : whole;
    if (!frac.empty()) out += "." + frac;
    return out;
}

} // namespace x18

// =============================================================================
// PairKey
// =============================================================================

PairKey PairKey::of(const std::string& x, const std::string& y) {
    if (x.empty() || y.empty()) {
        throw Error(ErrorCode::InvalidPair, "token identifier must not be empty");
    }
    if (x == y) {
        throw Error(ErrorCode::InvalidPair, "cannot pair token '" + x + "' with itself");
    }
    if (x.find('/') != std::string::npos || y.find('/') != std::string::npos) {
        throw Error(ErrorCode::InvalidPair, "token identifier must not contain '/'");
    }
    PairKey key;
    key.token_a = x < y ? x : y;
    key.token_b = x < y ? y : x;
    return key;
}

Amount Pool::price_a_in_b() const {
    if (reserve_a <= 0 || reserve_b <= 0) return 0;
    return math::mul_div(reserve_b, X18_ONE, reserve_a);
}

// =============================================================================
// LiquidityAction
// =============================================================================

const char* to_string(LiquidityAction action) {
    switch (action) {
        case LiquidityAction::Add: return "add";
        case LiquidityAction::Remove: return "remove";
    }
    return "unknown";
}

LiquidityAction liquidity_action_from_string(const std::string& s) {
    if (s == "add") return LiquidityAction::Add;
    if (s == "remove") return LiquidityAction::Remove;
    throw Error(ErrorCode::StorageError, "unknown liquidity action: " + s);
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace dataswap
