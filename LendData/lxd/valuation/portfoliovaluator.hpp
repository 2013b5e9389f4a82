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

/*! \file lxd/valuation/portfoliovaluator.hpp
    \brief Values every currency run of a portfolio
    \ingroup valuation
*/

#pragma once

#include <lxd/configuration/cashgroupconfig.hpp>
#include <lxd/marketdata/marketdataconfig.hpp>
#include <lxd/portfolio/portfolio.hpp>

#include <ql/shared_ptr.hpp>

#include <utility>
#include <vector>

namespace lend {
namespace data {

//! Net value per currency in native denomination
/*! Runs are valued in portfolio order, each starting where the previous one ended. Every
    currency in the portfolio needs a cash group and market data.

    \ingroup valuation
*/
class PortfolioValuator {
public:
    PortfolioValuator(const QuantLib::ext::shared_ptr<CashGroupConfigurations>& cashGroups,
                      const QuantLib::ext::shared_ptr<MarketDataConfig>& marketData);

    //! One entry per currency run; the portfolio's future claims carry the netted notionals afterwards
    std::vector<std::pair<CurrencyId, Amount>> value(Portfolio& portfolio, Timestamp now) const;

private:
    QuantLib::ext::shared_ptr<CashGroupConfigurations> cashGroups_;
    QuantLib::ext::shared_ptr<MarketDataConfig> marketData_;
};

} // namespace data
} // namespace lend
