/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <lxe/errors.hpp>
#include <lxe/math/fixedpoint64x64.hpp>

#include <cstdint>
#include <vector>

using boost::multiprecision::uint512_t;

namespace LendExt {

namespace {

typedef FixedPoint64x64::Value Value;

const Value& twoTo64() {
    static const Value v = Value(1) << 64;
    return v;
}

const Value& twoTo128() {
    static const Value v = Value(1) << 128;
    return v;
}

// exponents beyond +/- 64 leave the representable range
const Value& expBound() {
    static const Value v = Value(64) * twoTo64();
    return v;
}

// floor(x / d) for d > 0
Value floorDiv(const Value& x, const Value& d) {
    Value q = x / d;
    if (x < 0 && q * d != x)
        --q;
    return q;
}

Value checked(const Value& x, const char* op) {
    LXE_REQUIRE_ARITHMETIC(x >= FixedPoint64x64::minValue() && x <= FixedPoint64x64::maxValue(),
                           "64.64 overflow in " << op << ": " << x);
    return x;
}

// log2(e) as 1.128 fixed point
const Value& log2e() {
    static const Value v("0x171547652B82FE1777D0FFDA0D23A7D11");
    return v;
}

// 2^(2^-k) as 1.128 fixed point for k = 1..64, truncated
const std::vector<uint512_t>& exp2Factors() {
    static const char* hex[] = {
        "0x16A09E667F3BCC908B2FB1366EA957D3E", "0x1306FE0A31B7152DE8D5A46305C85EDEC",
        "0x1172B83C7D517ADCDF7C8C50EB14A7920", "0x10B5586CF9890F6298B92B71842A98364",
        "0x1059B0D31585743AE7C548EB68CA417FE", "0x102C9A3E778060EE6F7CACA4F7A29BDE9",
        "0x10163DA9FB33356D84A66AE336DCDFA40", "0x100B1AFA5ABCBED6129AB13EC11DC9544",
        "0x10058C86DA1C09EA1FF19D294CF2F679C", "0x1002C605E2E8CEC506D21BFC89A23A010",
        "0x100162F3904051FA128BCA9C55C31E5E0", "0x1000B175EFFDC76BA38E31671CA939726",
        "0x100058BA01FB9F96D6CACD4B180917C3E", "0x10002C5CC37DA9491D0985C348C68E7B3",
        "0x1000162E525EE054754457D5995292026", "0x10000B17255775C040618BF4A4ADE83FC",
        "0x1000058B91B5BC9AE2EED81E9B7D4CFAC", "0x100002C5C89D5EC6CA4D7C8ACC017B7C9",
        "0x10000162E43F4F831060E02D839A9D16D", "0x100000B1721BCFC99D9F890EA06911763",
        "0x10000058B90CF1E6D97F9CA14DBCC1628", "0x1000002C5C863B73F016468F6BAC5CA2C",
        "0x100000162E430E5A18F6119E3C02282A5", "0x1000000B1721835514B86E6D96EFD1BFF",
        "0x100000058B90C0B48C6BE5DF846C5B2F0", "0x10000002C5C8601CC6B9E94213C72737A",
        "0x1000000162E42FFF037DF38AA2B219F06", "0x10000000B17217FBA9C739AA5819F44F9",
        "0x1000000058B90BFCDEE5ACD3C1CEDC823", "0x100000002C5C85FE31F35A6A30DA1BE50",
        "0x10000000162E42FF0999CE3541B9FFFCF", "0x100000000B17217F80F4EF5AADDA45554",
        "0x10000000058B90BFBF8479BD5A81B51AD", "0x1000000002C5C85FDF84BD62AE30A74CC",
        "0x100000000162E42FEFB2FED257559BDAA", "0x1000000000B17217F7D5A7716BBA4A9AF",
        "0x100000000058B90BFBE9DDBAC5E109CCF", "0x10000000002C5C85FDF4B15DE6F17EB0D",
        "0x1000000000162E42FEFA494F1478FDE05", "0x10000000000B17217F7D20CF927C8E94C",
        "0x1000000000058B90BFBE8F71CB4E4B33E", "0x100000000002C5C85FDF477B662B26945",
        "0x10000000000162E42FEFA3AE53369388C", "0x100000000000B17217F7D1D351A389D40",
        "0x10000000000058B90BFBE8E8B2D3D4EDE", "0x1000000000002C5C85FDF4741BEA6E77F",
        "0x100000000000162E42FEFA39FE95583C3", "0x1000000000000B17217F7D1CFB72B45E2",
        "0x100000000000058B90BFBE8E7CC35C3F1", "0x10000000000002C5C85FDF473E242EA38",
        "0x1000000000000162E42FEFA39F02B772C", "0x10000000000000B17217F7D1CF7D83C1A",
        "0x1000000000000058B90BFBE8E7BDCBE2E", "0x100000000000002C5C85FDF473DEA871F",
        "0x10000000000000162E42FEFA39EF44D91", "0x100000000000000B17217F7D1CF79E949",
        "0x10000000000000058B90BFBE8E7BCE544", "0x1000000000000002C5C85FDF473DE6ECA",
        "0x100000000000000162E42FEFA39EF366F", "0x1000000000000000B17217F7D1CF79AFA",
        "0x100000000000000058B90BFBE8E7BCD6D", "0x10000000000000002C5C85FDF473DE6B2",
        "0x1000000000000000162E42FEFA39EF358", "0x10000000000000000B17217F7D1CF79AC"};
    static const std::vector<uint512_t> factors(hex, hex + 64);
    return factors;
}

} // namespace

const Value& FixedPoint64x64::minValue() {
    static const Value v = -(Value(1) << 127);
    return v;
}

const Value& FixedPoint64x64::maxValue() {
    static const Value v = (Value(1) << 127) - 1;
    return v;
}

const Value& FixedPoint64x64::one() { return twoTo64(); }

Value FixedPoint64x64::fromUInt(const Amount& x) {
    LXE_REQUIRE_ARITHMETIC(x >= 0 && x <= Amount(0x7FFFFFFFFFFFFFFFLL),
                           "value " << x << " cannot be represented as 64.64 fixed point");
    return Value(x) * twoTo64();
}

Amount FixedPoint64x64::toInt(const Value& x) { return Amount(floorDiv(x, twoTo64())); }

Value FixedPoint64x64::neg(const Value& x) {
    LXE_REQUIRE_ARITHMETIC(x != minValue(), "64.64 overflow in neg");
    return -x;
}

Value FixedPoint64x64::mul(const Value& x, const Value& y) { return checked(floorDiv(x * y, twoTo64()), "mul"); }

Value FixedPoint64x64::div(const Value& x, const Value& y) {
    LXE_REQUIRE_ARITHMETIC(y != 0, "64.64 division by zero");
    return checked((x * twoTo64()) / y, "div");
}

Value FixedPoint64x64::exp2(const Value& x) {
    LXE_REQUIRE_ARITHMETIC(x < expBound(), "64.64 overflow in exp2: " << x);
    if (x < -expBound())
        return Value(0);

    // split x into an integer part and a fraction in [0, 1)
    Value integral = floorDiv(x, twoTo64());
    std::uint64_t fraction = Value(x - integral * twoTo64()).convert_to<std::uint64_t>();

    // 2^fraction as 1.127 fixed point, one factor per set fraction bit
    uint512_t result = uint512_t(1) << 127;
    const std::vector<uint512_t>& factors = exp2Factors();
    for (unsigned k = 0; k < 64; ++k) {
        if (fraction & (std::uint64_t(1) << (63 - k)))
            result = (result * factors[k]) >> 128;
    }

    // integral lies in [-64, 63], the shift in [0, 127]
    unsigned shift = Value(63 - integral).convert_to<unsigned>();
    result >>= shift;

    LXE_REQUIRE_ARITHMETIC(result <= uint512_t(maxValue()), "64.64 overflow in exp2: " << x);
    return Value(result);
}

Value FixedPoint64x64::exp(const Value& x) {
    LXE_REQUIRE_ARITHMETIC(x < expBound(), "64.64 overflow in exp: " << x);
    if (x < -expBound())
        return Value(0);
    return exp2(floorDiv(x * log2e(), twoTo128()));
}

} // namespace LendExt
