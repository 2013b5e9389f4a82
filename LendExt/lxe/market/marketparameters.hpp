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

/*! \file lxe/market/marketparameters.hpp
    \brief Snapshot of one pooled market
    \ingroup market
*/

#pragma once

#include <lxe/types.hpp>

namespace LendExt {

//! State of the pooled market of one currency and maturity
/*! totalCash is in native denomination, totalClaim in underlying denomination. totalLiquidity
    counts the ownership units issued against the pool. The oracle rate is annualised, in units
    of the rate precision.
*/
struct MarketParameters {
    MarketParameters() : currencyId(0), maturity(0) {}
    MarketParameters(CurrencyId currencyId, Timestamp maturity, const Amount& totalClaim, const Amount& totalCash,
                     const Amount& totalLiquidity, const Amount& oracleRate)
        : currencyId(currencyId), maturity(maturity), totalClaim(totalClaim), totalCash(totalCash),
          totalLiquidity(totalLiquidity), oracleRate(oracleRate) {}

    CurrencyId currencyId;
    Timestamp maturity;
    Amount totalClaim;
    Amount totalCash;
    Amount totalLiquidity;
    Amount oracleRate;
};

} // namespace LendExt
