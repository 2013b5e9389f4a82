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
#include <lxd/configuration/cashgroupconfig.hpp>
#include <lxd/configuration/valuationparameters.hpp>
#include <lxd/marketdata/marketdataconfig.hpp>
#include <lxe/errors.hpp>
#include <lxt/datapaths.hpp>
#include <lxt/toplevelfixture.hpp>

using namespace lend::data;
using namespace LendExt;

BOOST_FIXTURE_TEST_SUITE(LendDataTestSuite, lend::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ConfigurationTest)

BOOST_AUTO_TEST_CASE(testCashGroupsFromFile) {
    BOOST_TEST_MESSAGE("Testing cash group configuration...");

    CashGroupConfigurations config;
    config.fromFile(TEST_INPUT_FILE("cashgroups.xml"));

    BOOST_CHECK_EQUAL(config.cashGroups().size(), 2);
    BOOST_REQUIRE(config.has(1));
    BOOST_REQUIRE(config.has(2));
    BOOST_CHECK(!config.has(3));
    BOOST_CHECK_THROW(config.get(3), QuantLib::Error);

    const CashGroup& usd = *config.get(1);
    BOOST_CHECK_EQUAL(usd.maxMarketIndex(), 2);
    BOOST_CHECK_EQUAL(usd.claimHaircut(), Amount(15000000));
    BOOST_CHECK_EQUAL(usd.debtBuffer(), Amount(15000000));
    BOOST_REQUIRE_EQUAL(usd.liquidityHaircuts().size(), 2);
    BOOST_CHECK_EQUAL(usd.liquidityHaircut(1), Amount(97));
    BOOST_CHECK_EQUAL(usd.liquidityHaircut(2), Amount(95));
    BOOST_CHECK_EQUAL(usd.tenorSchedule().size(), TenorSchedule::maxTiers);
    BOOST_CHECK_EQUAL(usd.convertFromUnderlying(Amount(1000)), Amount(1000));

    const CashGroup& eur = *config.get(2);
    BOOST_CHECK_EQUAL(eur.maxMarketIndex(), 3);
    BOOST_CHECK_EQUAL(eur.debtBuffer(), Amount(10000000));
    BOOST_CHECK_EQUAL(eur.tenorSchedule().size(), 3);
    BOOST_CHECK_EQUAL(eur.tenorSchedule().tenorLength(3), 720 * 86400);
    BOOST_CHECK_EQUAL(eur.liquidityHaircut(3), Amount(96));
    BOOST_CHECK_EQUAL(eur.assetRate().rate(), Amount("200000000000000000000000000"));
    BOOST_CHECK_EQUAL(eur.convertFromUnderlying(Amount(1000)), Amount(50000));
}

BOOST_AUTO_TEST_CASE(testInvalidCashGroups) {
    BOOST_TEST_MESSAGE("Testing invalid cash group configurations...");

    const std::string group = "<CashGroup currencyId=\"1\"><MaxMarketIndex>1</MaxMarketIndex>"
                              "<FutureClaimHaircutBps>150</FutureClaimHaircutBps><DebtBufferBps>150</DebtBufferBps>"
                              "<LiquidityHaircuts><Haircut>97</Haircut></LiquidityHaircuts></CashGroup>";

    CashGroupConfigurations config;
    config.fromXMLString("<CashGroups>" + group + "</CashGroups>");
    BOOST_CHECK(config.has(1));

    // duplicate currency
    BOOST_CHECK_THROW(config.fromXMLString("<CashGroups>" + group + group + "</CashGroups>"), QuantLib::Error);
    BOOST_CHECK_THROW(config.add(config.get(1)), QuantLib::Error);

    // haircut above 100
    BOOST_CHECK_THROW(config.fromXMLString("<CashGroups><CashGroup currencyId=\"1\"><MaxMarketIndex>1</MaxMarketIndex>"
                                           "<FutureClaimHaircutBps>150</FutureClaimHaircutBps>"
                                           "<DebtBufferBps>150</DebtBufferBps><LiquidityHaircuts>"
                                           "<Haircut>101</Haircut></LiquidityHaircuts></CashGroup></CashGroups>"),
                      QuantLib::Error);

    // one haircut per traded tier
    BOOST_CHECK_THROW(config.fromXMLString("<CashGroups><CashGroup currencyId=\"1\"><MaxMarketIndex>2</MaxMarketIndex>"
                                           "<FutureClaimHaircutBps>150</FutureClaimHaircutBps>"
                                           "<DebtBufferBps>150</DebtBufferBps><LiquidityHaircuts>"
                                           "<Haircut>97</Haircut></LiquidityHaircuts></CashGroup></CashGroups>"),
                      QuantLib::Error);

    // missing currency id
    BOOST_CHECK_THROW(config.fromXMLString("<CashGroups><CashGroup><MaxMarketIndex>1</MaxMarketIndex>"
                                           "<FutureClaimHaircutBps>150</FutureClaimHaircutBps>"
                                           "<DebtBufferBps>150</DebtBufferBps><LiquidityHaircuts>"
                                           "<Haircut>97</Haircut></LiquidityHaircuts></CashGroup></CashGroups>"),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testMarketDataFromFile) {
    BOOST_TEST_MESSAGE("Testing market data configuration...");

    MarketDataConfig config;
    config.fromFile(TEST_INPUT_FILE("marketdata.xml"));

    BOOST_CHECK_EQUAL(config.markets().size(), 2);
    BOOST_REQUIRE(config.has(1));
    BOOST_CHECK_THROW(config.get(4), QuantLib::Error);

    const CashGroupMarkets& usd = *config.get(1);
    BOOST_CHECK_EQUAL(usd.cashSupplyRate(), Amount(20000000));
    BOOST_REQUIRE_EQUAL(usd.markets().size(), 2);
    BOOST_CHECK_EQUAL(usd.markets()[0].maturity, 7783776000);
    BOOST_CHECK_EQUAL(usd.markets()[0].totalClaim, Amount(2000000));
    BOOST_CHECK_EQUAL(usd.markets()[0].totalLiquidity, Amount(500000));
    BOOST_CHECK_EQUAL(usd.markets()[1].oracleRate, Amount(60000000));

    const CashGroupMarkets& eur = *config.get(2);
    BOOST_CHECK_EQUAL(eur.cashSupplyRate(), Amount(0));
    BOOST_REQUIRE_EQUAL(eur.markets().size(), 1);
    BOOST_CHECK_EQUAL(eur.markets()[0].totalCash, Amount("50000000000000000000000000"));
    BOOST_CHECK_EQUAL(eur.markets()[0].currencyId, 2);
}

BOOST_AUTO_TEST_CASE(testInvalidMarketData) {
    BOOST_TEST_MESSAGE("Testing invalid market data...");

    MarketDataConfig config;
    // maturities must increase
    BOOST_CHECK_THROW(config.fromXMLString("<MarketData><Currency id=\"1\"><Markets>"
                                           "<Market><Maturity>7791552000</Maturity><TotalClaim>1</TotalClaim>"
                                           "<TotalCash>1</TotalCash><TotalLiquidity>1</TotalLiquidity>"
                                           "<OracleRate>1</OracleRate></Market>"
                                           "<Market><Maturity>7783776000</Maturity><TotalClaim>1</TotalClaim>"
                                           "<TotalCash>1</TotalCash><TotalLiquidity>1</TotalLiquidity>"
                                           "<OracleRate>1</OracleRate></Market>"
                                           "</Markets></Currency></MarketData>"),
                      ContractViolation);
    // negative pool cash
    BOOST_CHECK_THROW(config.fromXMLString("<MarketData><Currency id=\"1\"><Markets>"
                                           "<Market><Maturity>7783776000</Maturity><TotalClaim>1</TotalClaim>"
                                           "<TotalCash>-1</TotalCash><TotalLiquidity>1</TotalLiquidity>"
                                           "<OracleRate>1</OracleRate></Market>"
                                           "</Markets></Currency></MarketData>"),
                      ContractViolation);
    BOOST_CHECK_THROW(config.fromXMLString("<MarketData><Currency id=\"1\"/><Currency id=\"1\"/></MarketData>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(config.fromXMLString("<Markets/>"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testValuationParameters) {
    BOOST_TEST_MESSAGE("Testing valuation parameters...");

    ValuationParameters params;
    params.fromFile(TEST_INPUT_FILE("lendval.xml"));

    BOOST_CHECK(params.hasGroup("setup"));
    BOOST_CHECK(params.hasGroup("logging"));
    BOOST_CHECK(!params.hasGroup("markets"));
    BOOST_CHECK_EQUAL(params.get("setup", "asofTimestamp"), "7776432000");
    BOOST_CHECK_EQUAL(params.get("setup", "cashGroupsFile"), "cashgroups.xml");
    BOOST_CHECK_EQUAL(params.get("logging", "logMask"), "31");
    BOOST_CHECK(!params.has("setup", "outputFile"));
    BOOST_CHECK_EQUAL(params.get("setup", "outputFile", false), "");
    BOOST_CHECK_EQUAL(params.get("markets", "anything", false), "");
    BOOST_CHECK_THROW(params.get("setup", "outputFile"), QuantLib::Error);
    BOOST_CHECK_EQUAL(params.data("setup").size(), 5);

    BOOST_CHECK_THROW(params.fromXMLString("<LendValuation><Logging/></LendValuation>"), QuantLib::Error);
    BOOST_CHECK_THROW(params.fromXMLString("<LendValuation><Setup><Parameter>1</Parameter></Setup></LendValuation>"),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
