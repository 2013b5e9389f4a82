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

/*! \file lxd/valuation/groupaggregator.hpp
    \brief Net value of one currency run of a portfolio
    \ingroup valuation
*/

#pragma once

#include <lxd/valuation/positionvaluator.hpp>

namespace lend {
namespace data {

//! Value of a currency run and the start of the next run
struct GroupValue {
    GroupValue() : nextIndex(0) {}
    GroupValue(const Amount& value, Size nextIndex) : value(value), nextIndex(nextIndex) {}
    //! native denomination
    Amount value;
    Size nextIndex;
};

//! Aggregates the value of the currency run starting at a given index
/*! Two passes over the run:
    - every pooled liquidity position is valued with haircuts; its cash share adds to the
      native total, its claim either nets into a future claim or adds its present value to
      the underlying total
    - every future claim, with its notional after netting, adds its risk adjusted present
      value at the oracle rate of its maturity to the underlying total

    The underlying total is then converted with the cash group's asset rate.

    \ingroup valuation
*/
class GroupAggregator {
public:
    //! startIndex must be the first position of a run of the cash group's currency
    GroupValue groupValue(Portfolio& portfolio, const LendExt::CashGroup& cashGroup,
                          const LendExt::CashGroupMarkets& markets, Timestamp now, Size startIndex) const;
};

} // namespace data
} // namespace lend
