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
#include <lxd/utilities/parsers.hpp>
#include <lxt/toplevelfixture.hpp>

using namespace lend::data;
using LendExt::Position;
using QuantLib::Months;
using QuantLib::Period;
using QuantLib::Years;

BOOST_FIXTURE_TEST_SUITE(LendDataTestSuite, lend::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ParsersTest)

BOOST_AUTO_TEST_CASE(testParseAmount) {
    BOOST_TEST_MESSAGE("Testing amount parsing...");

    BOOST_CHECK_EQUAL(parseAmount("250000"), Amount(250000));
    BOOST_CHECK_EQUAL(parseAmount(" -250000 "), Amount(-250000));
    BOOST_CHECK_EQUAL(parseAmount("+42"), Amount(42));
    BOOST_CHECK_EQUAL(parseAmount("0"), Amount(0));
    BOOST_CHECK_EQUAL(parseAmount("1e18"), Amount("1000000000000000000"));
    BOOST_CHECK_EQUAL(parseAmount("0.97e18"), Amount("970000000000000000"));
    BOOST_CHECK_EQUAL(parseAmount("-2.5E17"), Amount("-250000000000000000"));
    BOOST_CHECK_EQUAL(parseAmount("1.50e1"), Amount(15));
    BOOST_CHECK_EQUAL(parseAmount("5e76"), Amount(Amount(5) * boost::multiprecision::pow(Amount(10), 76)));

    BOOST_CHECK_THROW(parseAmount(""), QuantLib::Error);
    BOOST_CHECK_THROW(parseAmount("abc"), QuantLib::Error);
    BOOST_CHECK_THROW(parseAmount("1.5"), QuantLib::Error);
    BOOST_CHECK_THROW(parseAmount("1e-3"), QuantLib::Error);
    BOOST_CHECK_THROW(parseAmount("1e100"), QuantLib::Error);
    // beyond 2^255 - 1
    BOOST_CHECK_THROW(parseAmount("1e77"), QuantLib::Error);
    BOOST_CHECK_THROW(parseAmount("12 34"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testParseNumbers) {
    BOOST_TEST_MESSAGE("Testing timestamp, integer and tier parsing...");

    BOOST_CHECK_EQUAL(parseTimestamp("7776432000"), Timestamp(7776432000ULL));
    BOOST_CHECK_THROW(parseTimestamp("-1"), QuantLib::Error);
    BOOST_CHECK_THROW(parseTimestamp("1.0"), QuantLib::Error);
    BOOST_CHECK_THROW(parseTimestamp("99999999999999999999999"), QuantLib::Error);

    BOOST_CHECK_EQUAL(parseInteger("-7"), -7);
    BOOST_CHECK_THROW(parseInteger("seven"), QuantLib::Error);
    BOOST_CHECK_EQUAL(parseSize("7"), 7);
    BOOST_CHECK_THROW(parseSize("-7"), QuantLib::Error);

    BOOST_CHECK_EQUAL(parseTier("1"), 1);
    BOOST_CHECK_EQUAL(parseTier("9"), 9);
    BOOST_CHECK_THROW(parseTier("0"), QuantLib::Error);
    BOOST_CHECK_THROW(parseTier("10"), QuantLib::Error);

    BOOST_CHECK(parseBool("true"));
    BOOST_CHECK(!parseBool("N"));
    BOOST_CHECK_THROW(parseBool("maybe"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testParsePeriodAndKind) {
    BOOST_TEST_MESSAGE("Testing period and position kind parsing...");

    BOOST_CHECK_EQUAL(parsePeriod("3M"), Period(3, Months));
    BOOST_CHECK_EQUAL(parsePeriod("20Y"), Period(20, Years));
    BOOST_CHECK_THROW(parsePeriod("3X"), QuantLib::Error);

    BOOST_CHECK(parsePositionKind("FutureClaim") == Position::Kind::FutureClaim);
    BOOST_CHECK(parsePositionKind("pooledliquidity") == Position::Kind::PooledLiquidity);
    BOOST_CHECK_THROW(parsePositionKind("Swap"), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
