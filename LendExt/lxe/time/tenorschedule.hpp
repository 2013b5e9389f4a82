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

/*! \file lxe/time/tenorschedule.hpp
    \brief Standardised market tenors and the quarterly reference time
    \ingroup time
*/

#pragma once

#include <lxe/time/valuationconstants.hpp>
#include <ql/time/period.hpp>

#include <utility>
#include <vector>

namespace LendExt {

//! Tenors of the markets of a cash group
/*! Markets roll on a quarterly cycle. At any time \c now the reference time is the start of
    the current quarter, and the market with tier i matures at referenceTime(now) plus the
    length of the i-th tenor. Tiers are numbered from 1.

    Tenors are converted to seconds with the 30/360 convention of the ValuationConstants and
    must be whole quarters, strictly increasing.

    \ingroup time
*/
class TenorSchedule {
public:
    //! Largest number of tiers a schedule can hold
    static constexpr Size maxTiers = 9;

    //! 3M, 6M, 1Y, 2Y, 5Y, 7Y, 10Y, 15Y, 20Y
    explicit TenorSchedule(const ValuationConstants& constants = ValuationConstants());
    TenorSchedule(const std::vector<QuantLib::Period>& tenors,
                  const ValuationConstants& constants = ValuationConstants());

    //! The standard nine tenors
    static std::vector<QuantLib::Period> standardTenors();

    Size size() const { return lengths_.size(); }
    const std::vector<QuantLib::Period>& tenors() const { return tenors_; }
    const ValuationConstants& constants() const { return constants_; }

    //! Length in seconds of the tenor of the given tier, tier must be in [1, size()]
    Timestamp tenorLength(Size tier) const;

    //! Start of the quarter containing now
    Timestamp referenceTime(Timestamp now) const;

    //! Maturity of the market with the given tier as seen at now
    Timestamp maturityAtMarketIndex(Size marketIndex, Timestamp now) const;

    /*! Index of the first market maturing at or after the given maturity, and whether the
        maturity falls between two markets (idiosyncratic). Only the first maxMarketIndex
        markets are considered; a maturity beyond the last of them is a ContractViolation.
    */
    std::pair<Size, bool> marketIndex(Size maxMarketIndex, Timestamp maturity, Timestamp now) const;

    //! true if the maturity is exactly the maturity of one of the first maxMarketIndex markets
    bool isValidMarketMaturity(Size maxMarketIndex, Timestamp maturity, Timestamp now) const;

private:
    void checkMaxMarketIndex(Size maxMarketIndex) const;
    Timestamp toSeconds(const QuantLib::Period& p) const;

    std::vector<QuantLib::Period> tenors_;
    std::vector<Timestamp> lengths_;
    ValuationConstants constants_;
};

} // namespace LendExt
