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

/*! \file lxd/app/lendvalapp.hpp
    \brief Valuation run driven by a parameter file
    \ingroup app
*/

#pragma once

#include <lxd/configuration/valuationparameters.hpp>
#include <lxd/portfolio/portfolio.hpp>

#include <ql/shared_ptr.hpp>

#include <ostream>
#include <utility>
#include <vector>

namespace lend {
namespace data {

//! Loads cash groups, market data and a portfolio and values the portfolio per currency
/*! File names in the setup group are resolved against inputPath, if given. When the
    parameters carry a Logging group, a FileLogger is registered for the duration of the run.

    \ingroup app
*/
class LendValApp {
public:
    LendValApp(const QuantLib::ext::shared_ptr<ValuationParameters>& params, bool console = false);
    virtual ~LendValApp();

    //! Runs the valuation and writes the output file, if configured
    virtual void run();

    //! Net value per currency of the last run
    const std::vector<std::pair<CurrencyId, Amount>>& results() const { return results_; }

    //! Writes the results as comma separated currencyId,value lines
    void writeResults(std::ostream& out) const;

private:
    void setupLog(const std::string& file, unsigned mask);
    void closeLog();
    std::string inputFile(const std::string& paramName) const;

    QuantLib::ext::shared_ptr<ValuationParameters> params_;
    bool console_;
    bool logOpen_;
    std::vector<std::pair<CurrencyId, Amount>> results_;
};

} // namespace data
} // namespace lend
