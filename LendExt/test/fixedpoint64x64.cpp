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
#include <lxe/math/fixedpoint64x64.hpp>
#include <lxt/toplevelfixture.hpp>

using namespace LendExt;

typedef FixedPoint64x64 FP;
typedef FP::Value Value;

BOOST_FIXTURE_TEST_SUITE(LendExtTestSuite, lend::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(FixedPoint64x64Test)

BOOST_AUTO_TEST_CASE(testConversions) {
    BOOST_TEST_MESSAGE("Testing 64.64 conversions...");

    BOOST_CHECK_EQUAL(FP::one(), Value(Value(1) << 64));
    BOOST_CHECK_EQUAL(FP::fromUInt(3), Value(Value(3) << 64));
    BOOST_CHECK_EQUAL(FP::toInt(FP::fromUInt(1000000000)), Amount(1000000000));
    // floor, not truncation
    BOOST_CHECK_EQUAL(FP::toInt(FP::one() * 3 / 2), Amount(1));
    BOOST_CHECK_EQUAL(FP::toInt(Value(-1)), Amount(-1));

    BOOST_CHECK_THROW(FP::fromUInt(Amount(-1)), ArithmeticFault);
    BOOST_CHECK_THROW(FP::fromUInt(Amount(1) << 63), ArithmeticFault);
    BOOST_CHECK_NO_THROW(FP::fromUInt((Amount(1) << 63) - 1));
}

BOOST_AUTO_TEST_CASE(testArithmetic) {
    BOOST_TEST_MESSAGE("Testing 64.64 multiplication and division...");

    Value half = FP::one() / 2;
    BOOST_CHECK_EQUAL(FP::mul(FP::fromUInt(6), half), FP::fromUInt(3));
    BOOST_CHECK_EQUAL(FP::div(FP::fromUInt(3), FP::fromUInt(6)), half);

    // mul rounds towards minus infinity, div towards zero
    BOOST_CHECK_EQUAL(FP::mul(Value(-1), half), Value(-1));
    BOOST_CHECK_EQUAL(FP::mul(Value(1), half), Value(0));
    BOOST_CHECK_EQUAL(FP::div(Value(-1), FP::fromUInt(2)), Value(0));

    BOOST_CHECK_EQUAL(FP::neg(FP::one()), Value(-FP::one()));
    BOOST_CHECK_EQUAL(FP::neg(FP::maxValue()), Value(FP::minValue() + 1));
    BOOST_CHECK_THROW(FP::neg(FP::minValue()), ArithmeticFault);

    BOOST_CHECK_THROW(FP::div(FP::one(), Value(0)), ArithmeticFault);
    BOOST_CHECK_THROW(FP::mul(FP::maxValue(), FP::fromUInt(2)), ArithmeticFault);
    BOOST_CHECK_THROW(FP::div(FP::maxValue(), half), ArithmeticFault);
}

BOOST_AUTO_TEST_CASE(testExp2) {
    BOOST_TEST_MESSAGE("Testing 64.64 exp2...");

    BOOST_CHECK_EQUAL(FP::exp2(Value(0)), FP::one());
    BOOST_CHECK_EQUAL(FP::exp2(FP::one()), FP::fromUInt(2));
    BOOST_CHECK_EQUAL(FP::exp2(FP::fromUInt(10)), FP::fromUInt(1024));
    BOOST_CHECK_EQUAL(FP::exp2(-FP::one()), Value(FP::one() / 2));
    BOOST_CHECK_EQUAL(FP::exp2(-FP::fromUInt(64)), Value(1));
    // sqrt(2) * 2^64, truncated
    BOOST_CHECK_EQUAL(FP::exp2(FP::one() / 2), Value("26087635650665564424"));

    BOOST_CHECK_EQUAL(FP::exp2(-FP::fromUInt(64) - 1), Value(0));
    BOOST_CHECK_EQUAL(FP::exp2(FP::fromUInt(62)), Value(Value(1) << 126));
    // 2^63 is one beyond the largest 64.64 value
    BOOST_CHECK_THROW(FP::exp2(FP::fromUInt(63)), ArithmeticFault);
    BOOST_CHECK_THROW(FP::exp2(FP::fromUInt(64)), ArithmeticFault);
}

BOOST_AUTO_TEST_CASE(testExp) {
    BOOST_TEST_MESSAGE("Testing 64.64 exp...");

    BOOST_CHECK_EQUAL(FP::exp(Value(0)), FP::one());

    // e^-1 against its double value, the 64.64 result is exact to far more digits than a double
    double expMinusOne = FP::exp(-FP::one()).convert_to<double>() / FP::one().convert_to<double>();
    BOOST_CHECK_CLOSE(expMinusOne, 0.36787944117144233, 1.0e-12);

    // decreasing for negative arguments
    Value previous = FP::exp(Value(0));
    for (int i = 1; i <= 40; ++i) {
        Value current = FP::exp(-FP::one() * i / 4);
        BOOST_CHECK_LT(current, previous);
        previous = current;
    }

    BOOST_CHECK_EQUAL(FP::exp(-FP::fromUInt(65)), Value(0));
    BOOST_CHECK_THROW(FP::exp(FP::fromUInt(64)), ArithmeticFault);
    BOOST_CHECK_THROW(FP::exp(FP::fromUInt(50)), ArithmeticFault);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
