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

/*! \file lxe/pricingengines/claimcalculator.hpp
    \brief Pro-rata claims of a pooled liquidity position
    \ingroup engines
*/

#pragma once

#include <lxe/cashgroup/cashgroup.hpp>
#include <lxe/instruments/position.hpp>
#include <lxe/market/marketparameters.hpp>

namespace LendExt {

//! Share of a pool's cash and future claim held by one position
struct ClaimShares {
    ClaimShares() {}
    ClaimShares(const Amount& cash, const Amount& claim) : cash(cash), claim(claim) {}
    //! native denomination
    Amount cash;
    //! underlying denomination, payable at the market maturity
    Amount claim;
};

//! Splits a pooled liquidity position into its claims on the pool
class ClaimCalculator {
public:
    //! total * notional / totalLiquidity for cash and claim
    ClaimShares cashClaims(const Position& position, const MarketParameters& market) const;

    //! total * notional * haircut(tier) / 100 / totalLiquidity for cash and claim
    ClaimShares haircutCashClaims(const Position& position, const MarketParameters& market,
                                  const CashGroup& cashGroup) const;

private:
    void checkPosition(const Position& position, const MarketParameters& market) const;
};

} // namespace LendExt
