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

/*! \file lxd/valuation/positionvaluator.hpp
    \brief Value of a pooled liquidity position, netted against the portfolio's future claims
    \ingroup valuation
*/

#pragma once

#include <lxd/portfolio/portfolio.hpp>
#include <lxe/market/cashgroupmarkets.hpp>

namespace lend {
namespace data {

//! Cash share in native denomination and claim value in underlying denomination
struct LiquidityTokenValue {
    LiquidityTokenValue() {}
    LiquidityTokenValue(const Amount& cashShare, const Amount& netValue) : cashShare(cashShare), netValue(netValue) {}
    Amount cashShare;
    //! present value of the claim share, zero when the claim was netted into a future claim
    Amount netValue;
};

//! Values one pooled liquidity position
/*! The market of the position is the one maturing exactly at the position maturity.
    The claim share is then either netted into the portfolio's future claim of the same
    currency and maturity, which leaves its valuation to the future claim pass, or it is
    discounted with the market's oracle rate.

    \ingroup valuation
*/
class PositionValuator {
public:
    /*! The position at index must be a pooled liquidity position of the cash group's currency.
        With useHaircut the claims are cut by the tier's liquidity haircut and the claim share is
        discounted risk adjusted.
    */
    LiquidityTokenValue liquidityTokenValue(Portfolio& portfolio, Size index, const LendExt::CashGroup& cashGroup,
                                            const LendExt::CashGroupMarkets& markets, Timestamp now,
                                            bool useHaircut) const;
};

} // namespace data
} // namespace lend
