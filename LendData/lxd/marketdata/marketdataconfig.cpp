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

#include <lxd/marketdata/marketdataconfig.hpp>
#include <lxd/utilities/log.hpp>
#include <lxd/utilities/parsers.hpp>

#include <ql/errors.hpp>

#include <vector>

using namespace LendExt;
using std::string;

namespace lend {
namespace data {

bool MarketDataConfig::has(CurrencyId currencyId) const { return markets_.find(currencyId) != markets_.end(); }

const QuantLib::ext::shared_ptr<CashGroupMarkets>& MarketDataConfig::get(CurrencyId currencyId) const {
    auto it = markets_.find(currencyId);
    QL_REQUIRE(it != markets_.end(), "no market data for currency " << currencyId);
    return it->second;
}

void MarketDataConfig::add(const QuantLib::ext::shared_ptr<CashGroupMarkets>& markets) {
    QL_REQUIRE(markets, "MarketDataConfig::add(): markets are null");
    QL_REQUIRE(!has(markets->currencyId()), "duplicate market data for currency " << markets->currencyId());
    markets_[markets->currencyId()] = markets;
}

void MarketDataConfig::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "MarketData");
    markets_.clear();

    for (XMLNode* c : XMLUtils::getChildrenNodes(node, "Currency")) {
        string id = XMLUtils::getAttribute(c, "id");
        QL_REQUIRE(!id.empty(), "Currency node without id attribute");
        CurrencyId currencyId = static_cast<CurrencyId>(parseSize(id));

        Amount cashSupplyRate = parseAmount(XMLUtils::getChildValue(c, "CashSupplyRate", false, "0"));

        std::vector<MarketParameters> markets;
        if (XMLNode* marketsNode = XMLUtils::getChildNode(c, "Markets")) {
            for (XMLNode* m : XMLUtils::getChildrenNodes(marketsNode, "Market")) {
                markets.push_back(MarketParameters(currencyId,
                                                   parseTimestamp(XMLUtils::getChildValue(m, "Maturity", true)),
                                                   parseAmount(XMLUtils::getChildValue(m, "TotalClaim", true)),
                                                   parseAmount(XMLUtils::getChildValue(m, "TotalCash", true)),
                                                   parseAmount(XMLUtils::getChildValue(m, "TotalLiquidity", true)),
                                                   parseAmount(XMLUtils::getChildValue(m, "OracleRate", true))));
            }
        }
        DLOG("Loaded " << markets.size() << " markets for currency " << currencyId);
        add(QuantLib::ext::make_shared<CashGroupMarkets>(currencyId, markets, cashSupplyRate));
    }
    LOG("Loaded market data for " << markets_.size() << " currencies");
}

} // namespace data
} // namespace lend
