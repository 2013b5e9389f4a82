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

#include <lxe/instruments/position.hpp>
#include <ql/errors.hpp>

#include <ostream>

namespace LendExt {

std::ostream& operator<<(std::ostream& out, Position::Kind kind) {
    switch (kind) {
    case Position::Kind::FutureClaim:
        return out << "FutureClaim";
    case Position::Kind::PooledLiquidity:
        return out << "PooledLiquidity";
    default:
        QL_FAIL("unknown position kind " << static_cast<int>(kind));
    }
}

std::ostream& operator<<(std::ostream& out, const Position& p) {
    out << p.kind();
    if (p.isPooledLiquidity())
        out << "(" << p.tier() << ")";
    return out << " " << p.currencyId() << "/" << p.maturity() << " notional " << p.notional();
}

} // namespace LendExt
