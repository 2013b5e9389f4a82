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
#include <lxe/pricingengines/claimcalculator.hpp>

using namespace LendExt::SafeInt256;

namespace LendExt {

void ClaimCalculator::checkPosition(const Position& position, const MarketParameters& market) const {
    LXE_REQUIRE_CONTRACT(position.isPooledLiquidity(), "claims requested for " << position);
    LXE_REQUIRE_CONTRACT(position.notional() >= 0, "negative pooled liquidity notional in " << position);
    LXE_REQUIRE_CONTRACT(position.currencyId() == market.currencyId && position.maturity() == market.maturity,
                         position << " does not belong to market " << market.currencyId << "/" << market.maturity);
}

ClaimShares ClaimCalculator::cashClaims(const Position& position, const MarketParameters& market) const {
    checkPosition(position, market);
    return ClaimShares(div(mul(market.totalCash, position.notional()), market.totalLiquidity),
                       div(mul(market.totalClaim, position.notional()), market.totalLiquidity));
}

ClaimShares ClaimCalculator::haircutCashClaims(const Position& position, const MarketParameters& market,
                                               const CashGroup& cashGroup) const {
    checkPosition(position, market);
    LXE_REQUIRE_CONTRACT(position.currencyId() == cashGroup.currencyId(),
                         "currency mismatch between " << position << " and cash group " << cashGroup.currencyId());

    Amount haircut = cashGroup.liquidityHaircut(position.tier());
    const Amount& percent = cashGroup.constants().percentagePrecision;
    Amount cash = div(div(mul(mul(market.totalCash, position.notional()), haircut), percent), market.totalLiquidity);
    Amount claim = div(div(mul(mul(market.totalClaim, position.notional()), haircut), percent), market.totalLiquidity);
    return ClaimShares(cash, claim);
}

} // namespace LendExt
