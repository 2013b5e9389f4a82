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
#include <lxd/valuation/groupaggregator.hpp>
#include <lxe/errors.hpp>
#include <lxe/pricingengines/discountengine.hpp>

using namespace LendExt;
using namespace LendExt::SafeInt256;

namespace lend {
namespace data {

GroupValue GroupAggregator::groupValue(Portfolio& portfolio, const CashGroup& cashGroup,
                                       const CashGroupMarkets& markets, Timestamp now, Size startIndex) const {
    LXE_REQUIRE_CONTRACT(startIndex < portfolio.size(),
                         "start index " << startIndex << " out of range, portfolio size " << portfolio.size());
    LXE_REQUIRE_CONTRACT(portfolio.runBegin(startIndex) == startIndex,
                         "start index " << startIndex << " is inside the run starting at "
                                        << portfolio.runBegin(startIndex));
    LXE_REQUIRE_CONTRACT(portfolio[startIndex].currencyId() == cashGroup.currencyId(),
                         "run at " << startIndex << " has currency " << portfolio[startIndex].currencyId()
                                   << ", cash group is " << cashGroup.currencyId());
    LXE_REQUIRE_CONTRACT(markets.currencyId() == cashGroup.currencyId(),
                         "markets of currency " << markets.currencyId() << " used with cash group "
                                                << cashGroup.currencyId());

    Size endIndex = portfolio.runEnd(startIndex);
    Amount assetValue = 0;
    Amount underlyingValue = 0;

    PositionValuator positionValuator;
    for (Size i = startIndex; i < endIndex; ++i) {
        if (!portfolio[i].isPooledLiquidity())
            continue;
        LiquidityTokenValue v = positionValuator.liquidityTokenValue(portfolio, i, cashGroup, markets, now, true);
        assetValue = add(assetValue, v.cashShare);
        underlyingValue = add(underlyingValue, v.netValue);
    }

    // future claims after netting
    DiscountEngine engine(cashGroup.constants());
    for (Size i = startIndex; i < endIndex; ++i) {
        const Position& p = portfolio[i];
        if (!p.isFutureClaim() || p.notional() == 0)
            continue;
        Amount rate = markets.oracleRate(cashGroup, p.maturity(), now);
        Amount value = engine.riskAdjustedPresentValue(cashGroup, p.notional(), p.maturity(), now, rate);
        TLOG("position " << i << ": " << p << " at oracle rate " << rate << " valued at " << value);
        underlyingValue = add(underlyingValue, value);
    }

    Amount total = add(assetValue, cashGroup.convertFromUnderlying(underlyingValue));
    DLOG("currency " << cashGroup.currencyId() << " positions [" << startIndex << ", " << endIndex
                     << "): cash " << assetValue << ", underlying " << underlyingValue << ", total " << total);
    return GroupValue(total, endIndex);
}

} // namespace data
} // namespace lend
