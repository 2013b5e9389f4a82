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

/*! \file lxe/instruments/position.hpp
    \brief Future claims and pooled liquidity positions
    \ingroup instruments
*/

#pragma once

#include <lxe/types.hpp>

#include <iosfwd>

namespace LendExt {

//! One line of a lending portfolio
/*! A FutureClaim pays its notional at maturity, a negative notional is a debt. A
    PooledLiquidity position holds notional ownership units of the pooled market of
    the given tier; its maturity is the maturity of that market.

    \ingroup instruments
*/
class Position {
public:
    enum class Kind { FutureClaim, PooledLiquidity };

    Position() : currencyId_(0), maturity_(0), kind_(Kind::FutureClaim), tier_(0) {}
    Position(CurrencyId currencyId, Timestamp maturity, Kind kind, Size tier, const Amount& notional)
        : currencyId_(currencyId), maturity_(maturity), kind_(kind), tier_(tier), notional_(notional) {}

    static Position futureClaim(CurrencyId currencyId, Timestamp maturity, const Amount& notional) {
        return Position(currencyId, maturity, Kind::FutureClaim, 0, notional);
    }
    static Position pooledLiquidity(CurrencyId currencyId, Timestamp maturity, Size tier, const Amount& notional) {
        return Position(currencyId, maturity, Kind::PooledLiquidity, tier, notional);
    }

    CurrencyId currencyId() const { return currencyId_; }
    Timestamp maturity() const { return maturity_; }
    Kind kind() const { return kind_; }
    //! Tier of a pooled liquidity position, 0 for a future claim
    Size tier() const { return tier_; }
    const Amount& notional() const { return notional_; }

    bool isFutureClaim() const { return kind_ == Kind::FutureClaim; }
    bool isPooledLiquidity() const { return kind_ == Kind::PooledLiquidity; }

    void setNotional(const Amount& notional) { notional_ = notional; }

private:
    CurrencyId currencyId_;
    Timestamp maturity_;
    Kind kind_;
    Size tier_;
    Amount notional_;
};

std::ostream& operator<<(std::ostream& out, Position::Kind kind);
std::ostream& operator<<(std::ostream& out, const Position& position);

} // namespace LendExt
