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

/*! \file lxd/portfolio/portfolio.hpp
    \brief Ordered positions of a lending account
    \ingroup portfolio
*/

#pragma once

#include <lxd/utilities/xmlutils.hpp>
#include <lxe/instruments/position.hpp>

#include <map>
#include <utility>
#include <vector>

namespace lend {
namespace data {
using LendExt::Amount;
using LendExt::CurrencyId;
using LendExt::Position;
using LendExt::Timestamp;
using QuantLib::Size;

//! Positions grouped into contiguous currency runs
/*! The positions of one currency must be adjacent. Within a run there is at most one
    FutureClaim per maturity. Both conditions are checked when the portfolio is built and
    violations raise a LendExt::ContractViolation.

    A valuation may change FutureClaim notionals through accumulateNotional(); reset() restores
    the notionals the portfolio was built with.

    \ingroup portfolio
*/
class Portfolio : public XMLSerializable {
public:
    Portfolio() {}
    explicit Portfolio(const std::vector<Position>& positions);

    //! \name Inspectors
    //@{
    Size size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }
    const std::vector<Position>& positions() const { return positions_; }
    const Position& operator[](Size i) const;
    //@}

    //! \name Currency runs
    //@{
    //! First index of every run, in portfolio order
    const std::vector<Size>& runStarts() const { return runStarts_; }
    //! First index of the run containing position i
    Size runBegin(Size i) const;
    //! One past the last index of the run containing position i
    Size runEnd(Size i) const;
    //@}

    /*! Index of the FutureClaim of the given currency and maturity, or size() if the
        portfolio holds none
    */
    Size futureClaimIndex(CurrencyId currencyId, Timestamp maturity) const;

    //! Adds amount to the notional of the FutureClaim at index i
    void accumulateNotional(Size i, const Amount& amount);

    //! Restores the notionals the portfolio was built with
    void reset();

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    //@}

private:
    void build(const std::vector<Position>& positions);

    std::vector<Position> positions_;
    std::vector<Amount> initialNotionals_;
    std::vector<Size> runStarts_;
    // per position, the index of its run in runStarts_
    std::vector<Size> runIndex_;
    std::map<std::pair<CurrencyId, Timestamp>, Size> futureClaims_;
};

} // namespace data
} // namespace lend
