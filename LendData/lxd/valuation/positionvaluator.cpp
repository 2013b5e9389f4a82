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

#include <lxd/utilities/log.hpp>
#include <lxd/valuation/positionvaluator.hpp>
#include <lxe/errors.hpp>
#include <lxe/pricingengines/claimcalculator.hpp>
#include <lxe/pricingengines/discountengine.hpp>

using namespace LendExt;

namespace lend {
namespace data {

LiquidityTokenValue PositionValuator::liquidityTokenValue(Portfolio& portfolio, Size index,
                                                          const CashGroup& cashGroup,
                                                          const CashGroupMarkets& markets, Timestamp now,
                                                          bool useHaircut) const {
    const Position& position = portfolio[index];
    LXE_REQUIRE_CONTRACT(position.isPooledLiquidity(), "position " << index << " is not pooled liquidity: " << position);
    LXE_REQUIRE_CONTRACT(position.currencyId() == cashGroup.currencyId(),
                         "position " << index << " (" << position << ") valued with cash group "
                                     << cashGroup.currencyId());

    const MarketParameters& market = markets.marketForMaturity(cashGroup, position.maturity(), now);

    ClaimCalculator claimCalculator;
    ClaimShares shares = useHaircut ? claimCalculator.haircutCashClaims(position, market, cashGroup)
                                    : claimCalculator.cashClaims(position, market);

    Size j = portfolio.futureClaimIndex(position.currencyId(), position.maturity());
    if (j < portfolio.size()) {
        TLOG("position " << index << ": claim share " << shares.claim << " netted into position " << j);
        portfolio.accumulateNotional(j, shares.claim);
        return LiquidityTokenValue(shares.cash, 0);
    }

    DiscountEngine engine(cashGroup.constants());
    Amount value = useHaircut ? engine.riskAdjustedPresentValue(cashGroup, shares.claim, market.maturity, now,
                                                                market.oracleRate)
                              : engine.presentValue(shares.claim, market.maturity, now, market.oracleRate);
    TLOG("position " << index << ": cash share " << shares.cash << ", claim share " << shares.claim
                     << " valued at " << value);
    return LiquidityTokenValue(shares.cash, value);
}

} // namespace data
} // namespace lend
