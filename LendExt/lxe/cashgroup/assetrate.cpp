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

#include <lxe/cashgroup/assetrate.hpp>
#include <lxe/errors.hpp>

namespace LendExt {

namespace {
const Amount& identityDecimals() {
    static const Amount d("1000000000000000000");
    return d;
}
} // namespace

AssetRate::AssetRate() : rate_(identityDecimals()), rateDecimals_(identityDecimals()) {}

AssetRate::AssetRate(const Amount& rate, const Amount& rateDecimals) : rate_(rate), rateDecimals_(rateDecimals) {
    QL_REQUIRE(rate_ > 0, "AssetRate: rate must be positive, got " << rate_);
    QL_REQUIRE(rateDecimals_ > 0, "AssetRate: rate decimals must be positive, got " << rateDecimals_);
    QL_REQUIRE(SafeInt256::inRange(rate_) && SafeInt256::inRange(rateDecimals_), "AssetRate: rate out of range");
}

Amount AssetRate::convertFromUnderlying(const Amount& underlying) const {
    return SafeInt256::mulDiv(underlying, rateDecimals_, rate_);
}

Amount AssetRate::convertToUnderlying(const Amount& asset) const {
    return SafeInt256::mulDiv(asset, rate_, rateDecimals_);
}

} // namespace LendExt
