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

#include <lxe/errors.hpp>
#include <lxe/time/tenorschedule.hpp>

using QuantLib::Months;
using QuantLib::Period;
using QuantLib::Years;

namespace LendExt {

TenorSchedule::TenorSchedule(const ValuationConstants& constants) : TenorSchedule(standardTenors(), constants) {}

TenorSchedule::TenorSchedule(const std::vector<Period>& tenors, const ValuationConstants& constants)
    : tenors_(tenors), constants_(constants) {
    QL_REQUIRE(!tenors_.empty(), "TenorSchedule: no tenors given");
    QL_REQUIRE(tenors_.size() <= maxTiers,
               "TenorSchedule: " << tenors_.size() << " tenors given, at most " << maxTiers << " allowed");
    QL_REQUIRE(constants_.quarter > 0, "TenorSchedule: quarter length must be positive");
    for (Size i = 0; i < tenors_.size(); ++i) {
        Timestamp length = toSeconds(tenors_[i]);
        QL_REQUIRE(length > 0, "TenorSchedule: tenor " << tenors_[i] << " must be positive");
        QL_REQUIRE(length % constants_.quarter == 0,
                   "TenorSchedule: tenor " << tenors_[i] << " is not a whole number of quarters");
        QL_REQUIRE(lengths_.empty() || length > lengths_.back(),
                   "TenorSchedule: tenors must be strictly increasing, got " << tenors_[i] << " after "
                                                                              << tenors_[i - 1]);
        lengths_.push_back(length);
    }
}

std::vector<Period> TenorSchedule::standardTenors() {
    return {Period(3, Months), Period(6, Months), Period(1, Years),  Period(2, Years), Period(5, Years),
            Period(7, Years),  Period(10, Years), Period(15, Years), Period(20, Years)};
}

Timestamp TenorSchedule::toSeconds(const Period& p) const {
    QL_REQUIRE(p.length() >= 0, "TenorSchedule: negative tenor " << p);
    Timestamp n = static_cast<Timestamp>(p.length());
    switch (p.units()) {
    case QuantLib::Days:
        return n * constants_.day;
    case QuantLib::Months:
        return n * constants_.month;
    case QuantLib::Years:
        return n * constants_.year;
    default:
        QL_FAIL("TenorSchedule: tenor " << p << " must be given in days, months or years");
    }
}

Timestamp TenorSchedule::tenorLength(Size tier) const {
    LXE_REQUIRE_CONTRACT(tier >= 1 && tier <= lengths_.size(),
                         "tier " << tier << " out of range, expected 1 to " << lengths_.size());
    return lengths_[tier - 1];
}

Timestamp TenorSchedule::referenceTime(Timestamp now) const { return now - now % constants_.quarter; }

Timestamp TenorSchedule::maturityAtMarketIndex(Size marketIndex, Timestamp now) const {
    return referenceTime(now) + tenorLength(marketIndex);
}

void TenorSchedule::checkMaxMarketIndex(Size maxMarketIndex) const {
    LXE_REQUIRE_CONTRACT(maxMarketIndex > 0, "no markets listed");
    LXE_REQUIRE_CONTRACT(maxMarketIndex <= lengths_.size(),
                         "max market index " << maxMarketIndex << " exceeds the " << lengths_.size()
                                             << " tenors of the schedule");
}

std::pair<Size, bool> TenorSchedule::marketIndex(Size maxMarketIndex, Timestamp maturity, Timestamp now) const {
    checkMaxMarketIndex(maxMarketIndex);
    Timestamp tRef = referenceTime(now);
    for (Size i = 1; i <= maxMarketIndex; ++i) {
        Timestamp marketMaturity = tRef + lengths_[i - 1];
        if (marketMaturity == maturity)
            return std::make_pair(i, false);
        // first market beyond the maturity
        if (marketMaturity > maturity)
            return std::make_pair(i, true);
    }
    LXE_FAIL_CONTRACT("no market found for maturity " << maturity << " at time " << now);
}

bool TenorSchedule::isValidMarketMaturity(Size maxMarketIndex, Timestamp maturity, Timestamp now) const {
    checkMaxMarketIndex(maxMarketIndex);
    if (maturity % constants_.quarter != 0)
        return false;
    Timestamp tRef = referenceTime(now);
    for (Size i = 1; i <= maxMarketIndex; ++i) {
        if (tRef + lengths_[i - 1] == maturity)
            return true;
    }
    return false;
}

} // namespace LendExt
