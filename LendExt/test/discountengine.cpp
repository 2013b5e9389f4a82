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

#include <boost/test/unit_test.hpp>
#include <lxe/errors.hpp>
#include <lxe/pricingengines/discountengine.hpp>
#include <lxt/toplevelfixture.hpp>

using namespace LendExt;

namespace {

const Timestamp day = 86400;
const Timestamp quarter = 90 * day;
const Timestamp year = 360 * day;
const Timestamp referenceTime = 1000 * quarter;
const Timestamp now = referenceTime + 5 * day;
const Timestamp maturity = referenceTime + quarter;

// 5% oracle rate, 150bp haircut and buffer
class F : public lend::test::TopLevelFixture {
public:
    F()
        : rate(50000000), cashGroup(1, 2, Amount(15000000), Amount(15000000), std::vector<QuantLib::Natural>{97, 95}) {}

    Amount rate;
    CashGroup cashGroup;
    DiscountEngine engine;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(LendExtTestSuite, lend::test::TopLevelFixture)

BOOST_FIXTURE_TEST_SUITE(DiscountEngineTest, F)

BOOST_AUTO_TEST_CASE(testDiscountFactor) {
    BOOST_TEST_MESSAGE("Testing discount factors...");

    BOOST_CHECK_EQUAL(engine.discountFactor(0, rate), Amount(1000000000));
    BOOST_CHECK_EQUAL(engine.discountFactor(year, 0), Amount(1000000000));

    // 1e9 * exp(-0.05 t), truncated
    BOOST_CHECK_EQUAL(engine.discountFactor(day, rate), Amount(999861121));
    BOOST_CHECK_EQUAL(engine.discountFactor(quarter, rate), Amount(987577800));
    BOOST_CHECK_EQUAL(engine.discountFactor(year, rate), Amount(951229424));
    BOOST_CHECK_EQUAL(engine.discountFactor(10 * year, rate), Amount(606530659));
    BOOST_CHECK_EQUAL(engine.discountFactor(20 * year, rate), Amount(367879441));
    // only the product of rate and time matters
    BOOST_CHECK_EQUAL(engine.discountFactor(2 * year, rate), engine.discountFactor(year, 2 * rate));
}

BOOST_AUTO_TEST_CASE(testDiscountFactorMonotonic) {
    BOOST_TEST_MESSAGE("Testing discount factors decrease in time and rate...");

    Amount previous = engine.discountFactor(0, rate);
    for (Timestamp t = quarter; t <= 50 * year; t += quarter) {
        Amount current = engine.discountFactor(t, rate);
        BOOST_CHECK_LT(current, previous);
        previous = current;
    }

    previous = engine.discountFactor(year, 0);
    for (int bp = 25; bp <= 10000; bp += 25) {
        Amount current = engine.discountFactor(year, Amount(bp) * 100000);
        BOOST_CHECK_LT(current, previous);
        previous = current;
    }
}

BOOST_AUTO_TEST_CASE(testDiscountFactorOverflow) {
    BOOST_TEST_MESSAGE("Testing discount factor overflow...");

    BOOST_CHECK_THROW(engine.discountFactor(year, Amount(1) << 70), ArithmeticFault);
    BOOST_CHECK_THROW(engine.discountFactor(year, Amount(-1)), ArithmeticFault);
}

BOOST_AUTO_TEST_CASE(testPresentValue) {
    BOOST_TEST_MESSAGE("Testing present values...");

    BOOST_CHECK_EQUAL(engine.presentValue(1000000, maturity, now, rate), Amount(988263));
    BOOST_CHECK_EQUAL(engine.presentValue(-1000000, maturity, now, rate), Amount(-988263));
    BOOST_CHECK_EQUAL(engine.presentValue(1000000, now, now, rate), Amount(1000000));

    // a zero notional is not discounted at all, not even a past maturity is checked
    BOOST_CHECK_EQUAL(engine.presentValue(0, maturity, now, rate), Amount(0));
    BOOST_CHECK_EQUAL(engine.presentValue(0, now - year, now, rate), Amount(0));

    BOOST_CHECK_THROW(engine.presentValue(1000000, now - 1, now, rate), ContractViolation);
}

BOOST_AUTO_TEST_CASE(testRiskAdjustedPresentValue) {
    BOOST_TEST_MESSAGE("Testing risk adjusted present values...");

    Amount assetValue = engine.riskAdjustedPresentValue(cashGroup, 1000000, maturity, now, rate);
    BOOST_CHECK_EQUAL(assetValue, Amount(984769));
    BOOST_CHECK_LE(assetValue, engine.presentValue(1000000, maturity, now, rate));

    Amount debtValue = engine.riskAdjustedPresentValue(cashGroup, -1000000, maturity, now, rate);
    BOOST_CHECK_EQUAL(debtValue, Amount(-991770));
    BOOST_CHECK_LT(debtValue, engine.presentValue(-1000000, maturity, now, rate));

    BOOST_CHECK_EQUAL(engine.riskAdjustedPresentValue(cashGroup, 0, maturity, now, rate), Amount(0));
}

BOOST_AUTO_TEST_CASE(testDebtFloor) {
    BOOST_TEST_MESSAGE("Testing that debts are floored at their notional...");

    // debt buffer above the oracle rate
    BOOST_CHECK_EQUAL(engine.riskAdjustedPresentValue(cashGroup, -1000000, maturity, now, Amount(10000000)),
                      Amount(-1000000));
    // debt buffer equal to the oracle rate
    BOOST_CHECK_EQUAL(engine.riskAdjustedPresentValue(cashGroup, -1000000, maturity, now, Amount(15000000)),
                      Amount(-1000000));
    // far maturities do not change that
    BOOST_CHECK_EQUAL(engine.riskAdjustedPresentValue(cashGroup, -1000000, now + 20 * year, now, Amount(0)),
                      Amount(-1000000));
    // assets are still discounted at the haircut
    BOOST_CHECK_LT(engine.riskAdjustedPresentValue(cashGroup, 1000000, maturity, now, Amount(0)), Amount(1000000));
}

BOOST_AUTO_TEST_CASE(testSettlementDate) {
    BOOST_TEST_MESSAGE("Testing settlement dates...");

    const TenorSchedule& schedule = cashGroup.tenorSchedule();

    BOOST_CHECK_EQUAL(engine.settlementDate(Position::futureClaim(1, maturity, 100), schedule), maturity);
    BOOST_CHECK_EQUAL(engine.settlementDate(Position::pooledLiquidity(1, referenceTime + quarter, 1, 100), schedule),
                      referenceTime + quarter);
    BOOST_CHECK_EQUAL(
        engine.settlementDate(Position::pooledLiquidity(1, referenceTime + 2 * quarter, 2, 100), schedule),
        referenceTime + quarter);
    BOOST_CHECK_EQUAL(engine.settlementDate(Position::pooledLiquidity(1, referenceTime + 20 * year, 9, 100), schedule),
                      referenceTime + quarter);

    BOOST_CHECK_THROW(engine.settlementDate(Position::pooledLiquidity(1, maturity, 0, 100), schedule),
                      ContractViolation);
    BOOST_CHECK_THROW(engine.settlementDate(Position::pooledLiquidity(1, maturity, 10, 100), schedule),
                      ContractViolation);
    BOOST_CHECK_THROW(engine.settlementDate(Position::pooledLiquidity(1, year, 9, 100), schedule),
                      ContractViolation);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
