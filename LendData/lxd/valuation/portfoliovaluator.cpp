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

#include <lxd/utilities/log.hpp>
#include <lxd/valuation/groupaggregator.hpp>
#include <lxd/valuation/portfoliovaluator.hpp>
#include <lxe/errors.hpp>

namespace lend {
namespace data {

PortfolioValuator::PortfolioValuator(const QuantLib::ext::shared_ptr<CashGroupConfigurations>& cashGroups,
                                     const QuantLib::ext::shared_ptr<MarketDataConfig>& marketData)
    : cashGroups_(cashGroups), marketData_(marketData) {
    QL_REQUIRE(cashGroups_, "PortfolioValuator: no cash group configurations given");
    QL_REQUIRE(marketData_, "PortfolioValuator: no market data given");
}

std::vector<std::pair<CurrencyId, Amount>> PortfolioValuator::value(Portfolio& portfolio, Timestamp now) const {
    LOG("Valuing portfolio of " << portfolio.size() << " positions at " << now);
    std::vector<std::pair<CurrencyId, Amount>> result;
    GroupAggregator aggregator;

    Size index = 0;
    while (index < portfolio.size()) {
        CurrencyId ccy = portfolio[index].currencyId();
        LXE_REQUIRE_CONTRACT(cashGroups_->has(ccy), "no cash group for currency " << ccy);
        LXE_REQUIRE_CONTRACT(marketData_->has(ccy), "no market data for currency " << ccy);
        GroupValue v = aggregator.groupValue(portfolio, *cashGroups_->get(ccy), *marketData_->get(ccy), now, index);
        LOG("Currency " << ccy << " value " << v.value);
        result.push_back(std::make_pair(ccy, v.value));
        index = v.nextIndex;
    }
    return result;
}

} // namespace data
} // namespace lend
