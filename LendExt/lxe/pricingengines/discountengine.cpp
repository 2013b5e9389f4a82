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
#include <lxe/math/fixedpoint64x64.hpp>
#include <lxe/pricingengines/discountengine.hpp>

namespace LendExt {

DiscountEngine::DiscountEngine(const ValuationConstants& constants) : constants_(constants) {
    QL_REQUIRE(constants_.ratePrecision > 0, "DiscountEngine: rate precision must be positive");
    QL_REQUIRE(constants_.rateTimeBasis > 0, "DiscountEngine: rate time basis must be positive");
}

Amount DiscountEngine::discountFactor(Timestamp timeToMaturity, const Amount& oracleRate) const {
    typedef FixedPoint64x64 FP;

    Amount scaledRate =
        SafeInt256::div(SafeInt256::mul(oracleRate, Amount(timeToMaturity)), Amount(constants_.rateTimeBasis));
    FP::Value precision = FP::fromUInt(constants_.ratePrecision);

    FP::Value expValue = FP::div(FP::fromUInt(scaledRate), precision);
    expValue = FP::exp(FP::neg(expValue));
    expValue = FP::mul(expValue, precision);
    Amount factor = FP::toInt(expValue);

    LXE_REQUIRE_ARITHMETIC(factor <= constants_.ratePrecision,
                           "discount factor " << factor << " exceeds unity (" << constants_.ratePrecision
                                              << ") for rate " << oracleRate << " and time " << timeToMaturity);
    return factor;
}

Amount DiscountEngine::discount(const Amount& notional, Timestamp maturity, Timestamp now, const Amount& rate) const {
    LXE_REQUIRE_CONTRACT(maturity >= now, "maturity " << maturity << " is before the valuation time " << now);
    Amount factor = discountFactor(maturity - now, rate);
    return SafeInt256::mulDiv(notional, factor, constants_.ratePrecision);
}

Amount DiscountEngine::presentValue(const Amount& notional, Timestamp maturity, Timestamp now,
                                   const Amount& oracleRate) const {
    if (notional == 0)
        return Amount(0);
    return discount(notional, maturity, now, oracleRate);
}

Amount DiscountEngine::riskAdjustedPresentValue(const CashGroup& cashGroup, const Amount& notional,
                                                Timestamp maturity, Timestamp now, const Amount& oracleRate) const {
    if (notional == 0)
        return Amount(0);

    if (notional > 0)
        return discount(notional, maturity, now, SafeInt256::add(oracleRate, cashGroup.claimHaircut()));

    // a debt is never valued above its notional
    if (cashGroup.debtBuffer() >= oracleRate)
        return notional;
    return discount(notional, maturity, now, SafeInt256::sub(oracleRate, cashGroup.debtBuffer()));
}

Timestamp DiscountEngine::settlementDate(const Position& position, const TenorSchedule& tenorSchedule) const {
    if (position.isFutureClaim())
        return position.maturity();

    LXE_REQUIRE_CONTRACT(position.tier() >= 1 && position.tier() <= TenorSchedule::maxTiers,
                         "invalid tier " << position.tier() << " for pooled liquidity");
    Timestamp tenorLength = tenorSchedule.tenorLength(position.tier());
    LXE_REQUIRE_CONTRACT(position.maturity() >= tenorLength,
                         "maturity " << position.maturity() << " is shorter than the tenor of tier " << position.tier());
    // maturity = reference time + tenor length, settlement is one quarter after the reference time
    return position.maturity() - tenorLength + constants_.quarter;
}

} // namespace LendExt
