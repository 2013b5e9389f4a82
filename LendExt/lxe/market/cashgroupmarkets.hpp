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

/*! \file lxe/market/cashgroupmarkets.hpp
    \brief Ordered market snapshots of one currency
    \ingroup market
*/

#pragma once

#include <lxe/cashgroup/cashgroup.hpp>
#include <lxe/market/marketparameters.hpp>

#include <vector>

namespace LendExt {

//! The active markets of one currency, ordered by tier
/*! The i-th entry is the market of tier i + 1. Lookups verify that the stored maturity is the
    one the tenor schedule of the cash group expects at the valuation time.

    \ingroup market
*/
class CashGroupMarkets {
public:
    /*! The cash supply rate is the annualised rate earned on plain cash. It serves as the
        short end when interpolating oracle rates for maturities before the first market.
    */
    CashGroupMarkets(CurrencyId currencyId, const std::vector<MarketParameters>& markets,
                     const Amount& cashSupplyRate = Amount(0));

    CurrencyId currencyId() const { return currencyId_; }
    const std::vector<MarketParameters>& markets() const { return markets_; }
    const Amount& cashSupplyRate() const { return cashSupplyRate_; }

    //! Market of the given tier as seen at now
    const MarketParameters& market(const CashGroup& cashGroup, Size marketIndex, Timestamp now) const;

    //! Market maturing exactly at the given maturity, off-schedule maturities are a ContractViolation
    const MarketParameters& marketForMaturity(const CashGroup& cashGroup, Timestamp maturity, Timestamp now) const;

    /*! Oracle rate for an arbitrary maturity. On-schedule maturities return the oracle rate of
        their market, other maturities interpolate linearly between the neighbouring markets.
    */
    Amount oracleRate(const CashGroup& cashGroup, Timestamp maturity, Timestamp now) const;

private:
    CurrencyId currencyId_;
    std::vector<MarketParameters> markets_;
    Amount cashSupplyRate_;
};

//! Linear interpolation of the rate at assetMaturity, shortMaturity < assetMaturity < longMaturity
Amount interpolateOracleRate(Timestamp shortMaturity, Timestamp longMaturity, const Amount& shortRate,
                             const Amount& longRate, Timestamp assetMaturity);

} // namespace LendExt
