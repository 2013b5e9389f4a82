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

/*! \file lxe/pricingengines/discountengine.hpp
    \brief Continuous discounting of future claims
    \ingroup engines
*/

#pragma once

#include <lxe/cashgroup/cashgroup.hpp>
#include <lxe/instruments/position.hpp>
#include <lxe/time/valuationconstants.hpp>

namespace LendExt {

//! Discounts future claims with a continuously compounded oracle rate
/*! The discount factor for a time to maturity t and an oracle rate r is

    \f[ P = R e^{-\frac{r t}{T R}} \f]

    with R the rate precision and T the rate time basis, evaluated in 64.64 fixed point.
    \f$ r t / T \f$ is an integer division. The factor is an integer in rate precision units
    and never exceeds R.

    \ingroup engines
*/
class DiscountEngine {
public:
    explicit DiscountEngine(const ValuationConstants& constants = ValuationConstants());

    const ValuationConstants& constants() const { return constants_; }

    //! Discount factor in rate precision units
    Amount discountFactor(Timestamp timeToMaturity, const Amount& oracleRate) const;

    //! notional * discountFactor / ratePrecision, zero notionals are not discounted
    Amount presentValue(const Amount& notional, Timestamp maturity, Timestamp now, const Amount& oracleRate) const;

    /*! Present value with the discount rate widened by the claim haircut for positive
        notionals and narrowed by the debt buffer for negative ones. A negative notional
        whose debt buffer reaches the oracle rate is returned undiscounted.
    */
    Amount riskAdjustedPresentValue(const CashGroup& cashGroup, const Amount& notional, Timestamp maturity,
                                    Timestamp now, const Amount& oracleRate) const;

    /*! Future claims settle at maturity. Pooled liquidity settles on the quarterly cycle,
        i.e. at maturity - tenorLength(tier) + quarter.
    */
    Timestamp settlementDate(const Position& position, const TenorSchedule& tenorSchedule) const;

private:
    Amount discount(const Amount& notional, Timestamp maturity, Timestamp now, const Amount& rate) const;

    ValuationConstants constants_;
};

} // namespace LendExt
