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
#include <lxe/math/safeint256.hpp>

using boost::multiprecision::int512_t;

namespace LendExt {
namespace SafeInt256 {

namespace {

Amount narrow(const int512_t& x, const char* op) {
    LXE_REQUIRE_ARITHMETIC(x >= int512_t(min()) && x <= int512_t(max()), "int256 overflow in " << op << ": " << x);
    return Amount(x);
}

} // namespace

const Amount& max() {
    static const Amount m = (Amount(1) << 255) - 1;
    return m;
}

const Amount& min() {
    static const Amount m = -(Amount(1) << 255);
    return m;
}

bool inRange(const Amount& x) { return x >= min() && x <= max(); }

Amount add(const Amount& x, const Amount& y) { return narrow(int512_t(x) + int512_t(y), "add"); }

Amount sub(const Amount& x, const Amount& y) { return narrow(int512_t(x) - int512_t(y), "sub"); }

Amount mul(const Amount& x, const Amount& y) { return narrow(int512_t(x) * int512_t(y), "mul"); }

Amount div(const Amount& x, const Amount& y) {
    LXE_REQUIRE_ARITHMETIC(y != 0, "int256 division by zero (" << x << " / 0)");
    // -2^255 / -1 is the only quotient that leaves the range
    return narrow(int512_t(x) / int512_t(y), "div");
}

Amount neg(const Amount& x) { return narrow(-int512_t(x), "neg"); }

Amount mulDiv(const Amount& x, const Amount& y, const Amount& precision) { return div(mul(x, y), precision); }

} // namespace SafeInt256
} // namespace LendExt
