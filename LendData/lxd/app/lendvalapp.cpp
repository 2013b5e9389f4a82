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

#include <lxd/app/lendvalapp.hpp>
#include <lxd/configuration/cashgroupconfig.hpp>
#include <lxd/marketdata/marketdataconfig.hpp>
#include <lxd/utilities/log.hpp>
#include <lxd/utilities/parsers.hpp>
#include <lxd/valuation/portfoliovaluator.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/timer/timer.hpp>

#include <ql/errors.hpp>

#include <iostream>

using boost::timer::cpu_timer;
using boost::timer::default_places;

namespace lend {
namespace data {

LendValApp::LendValApp(const QuantLib::ext::shared_ptr<ValuationParameters>& params, bool console)
    : params_(params), console_(console), logOpen_(false) {
    QL_REQUIRE(params_, "LendValApp: no parameters given");
}

LendValApp::~LendValApp() {
    if (logOpen_)
        closeLog();
}

void LendValApp::run() {
    cpu_timer timer;

    if (params_->hasGroup("logging")) {
        string logFile = params_->get("logging", "logFile");
        string logMask = params_->get("logging", "logMask", false);
        setupLog(logFile, logMask.empty() ? 31 : static_cast<unsigned>(parseSize(logMask)));
    }
    params_->log();

    Timestamp asof = parseTimestamp(params_->get("setup", "asofTimestamp"));

    auto cashGroups = QuantLib::ext::make_shared<CashGroupConfigurations>();
    cashGroups->fromFile(inputFile("cashGroupsFile"));
    auto marketData = QuantLib::ext::make_shared<MarketDataConfig>();
    marketData->fromFile(inputFile("marketDataFile"));
    Portfolio portfolio;
    portfolio.fromFile(inputFile("portfolioFile"));

    PortfolioValuator valuator(cashGroups, marketData);
    results_ = valuator.value(portfolio, asof);

    string outputFile = params_->get("setup", "outputFile", false);
    if (!outputFile.empty()) {
        boost::filesystem::path p(outputFile);
        if (p.has_parent_path() && !boost::filesystem::exists(p.parent_path()))
            boost::filesystem::create_directories(p.parent_path());
        boost::filesystem::ofstream out(p);
        QL_REQUIRE(out.is_open(), "error opening output file " << outputFile);
        writeResults(out);
        LOG("Results written to " << outputFile);
    }

    if (console_) {
        writeResults(std::cout);
        std::cout << "run time: " << timer.format(default_places, "%w") << " sec" << std::endl;
    }
    LOG("lendval done.");
}

void LendValApp::writeResults(std::ostream& out) const {
    out << "#CurrencyId,Value" << std::endl;
    for (const auto& r : results_)
        out << r.first << "," << r.second << std::endl;
}

void LendValApp::setupLog(const std::string& file, unsigned mask) {
    closeLog();

    boost::filesystem::path p(file);
    if (p.has_parent_path() && !boost::filesystem::exists(p.parent_path()))
        boost::filesystem::create_directories(p.parent_path());

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    Log::instance().setMask(mask);
    Log::instance().switchOn();
    logOpen_ = true;
}

void LendValApp::closeLog() {
    Log::instance().removeAllLoggers();
    logOpen_ = false;
}

string LendValApp::inputFile(const std::string& paramName) const {
    string inputPath = params_->get("setup", "inputPath", false);
    string file = params_->get("setup", paramName);
    if (inputPath.empty())
        return file;
    return (boost::filesystem::path(inputPath) / file).string();
}

} // namespace data
} // namespace lend
