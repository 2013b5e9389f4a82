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

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>
#include <lxd/app/lendvalapp.hpp>
#include <lxt/datapaths.hpp>
#include <lxt/toplevelfixture.hpp>

#include <sstream>
#include <vector>

using namespace lend::data;
namespace fs = boost::filesystem;

namespace {

std::string parameters(const std::string& inputPath, const std::string& outputFile) {
    std::ostringstream xml;
    xml << "<LendValuation><Setup>"
        << "<Parameter name=\"asofTimestamp\">7776432000</Parameter>"
        << "<Parameter name=\"inputPath\">" << inputPath << "</Parameter>"
        << "<Parameter name=\"cashGroupsFile\">cashgroups.xml</Parameter>"
        << "<Parameter name=\"marketDataFile\">marketdata.xml</Parameter>"
        << "<Parameter name=\"portfolioFile\">portfolio.xml</Parameter>";
    if (!outputFile.empty())
        xml << "<Parameter name=\"outputFile\">" << outputFile << "</Parameter>";
    xml << "</Setup></LendValuation>";
    return xml.str();
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(LendDataTestSuite, lend::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LendValAppTest)

BOOST_AUTO_TEST_CASE(testRun) {
    BOOST_TEST_MESSAGE("Testing a valuation run from a parameter file...");

    fs::path outputFile = fs::temp_directory_path() / fs::unique_path("lendval-%%%%-%%%%") / "valuation.csv";

    auto params = QuantLib::ext::make_shared<ValuationParameters>();
    params->fromXMLString(parameters(TEST_INPUT_PATH.string(), outputFile.string()));
    LendValApp app(params);
    app.run();

    BOOST_REQUIRE_EQUAL(app.results().size(), 2);
    BOOST_CHECK_EQUAL(app.results()[0].second, Amount(319658));
    BOOST_CHECK_EQUAL(app.results()[1].second, Amount(48209));

    BOOST_REQUIRE(fs::exists(outputFile));
    fs::ifstream in(outputFile);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line))
        lines.push_back(line);
    in.close();
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "#CurrencyId,Value");
    BOOST_CHECK_EQUAL(lines[1], "1,319658");
    BOOST_CHECK_EQUAL(lines[2], "2,48209");

    fs::remove_all(outputFile.parent_path());
}

BOOST_AUTO_TEST_CASE(testMissingInput) {
    BOOST_TEST_MESSAGE("Testing a valuation run with missing input files...");

    auto params = QuantLib::ext::make_shared<ValuationParameters>();
    params->fromXMLString(parameters((TEST_INPUT_PATH / "missing").string(), ""));
    LendValApp app(params);
    BOOST_CHECK_THROW(app.run(), QuantLib::Error);
    BOOST_CHECK(app.results().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
