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

#include <lxd/configuration/cashgroupconfig.hpp>
#include <lxd/utilities/log.hpp>
#include <lxd/utilities/parsers.hpp>

#include <ql/errors.hpp>

using namespace LendExt;
using std::string;
using std::vector;

namespace lend {
namespace data {

bool CashGroupConfigurations::has(CurrencyId currencyId) const {
    return cashGroups_.find(currencyId) != cashGroups_.end();
}

const QuantLib::ext::shared_ptr<CashGroup>& CashGroupConfigurations::get(CurrencyId currencyId) const {
    auto it = cashGroups_.find(currencyId);
    QL_REQUIRE(it != cashGroups_.end(), "no cash group configured for currency " << currencyId);
    return it->second;
}

void CashGroupConfigurations::add(const QuantLib::ext::shared_ptr<CashGroup>& cashGroup) {
    QL_REQUIRE(cashGroup, "CashGroupConfigurations::add(): cash group is null");
    QL_REQUIRE(!has(cashGroup->currencyId()), "duplicate cash group for currency " << cashGroup->currencyId());
    cashGroups_[cashGroup->currencyId()] = cashGroup;
}

void CashGroupConfigurations::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "CashGroups");
    cashGroups_.clear();

    for (XMLNode* n : XMLUtils::getChildrenNodes(node, "CashGroup")) {
        string id = XMLUtils::getAttribute(n, "currencyId");
        QL_REQUIRE(!id.empty(), "CashGroup without currencyId attribute");
        CurrencyId currencyId = static_cast<CurrencyId>(parseSize(id));
        DLOG("Loading cash group for currency " << currencyId);

        TenorSchedule schedule;
        vector<string> tenorStrings = XMLUtils::getChildrenValues(n, "Tenors", "Tenor", false);
        if (!tenorStrings.empty()) {
            vector<QuantLib::Period> tenors;
            for (const auto& t : tenorStrings)
                tenors.push_back(parsePeriod(t));
            schedule = TenorSchedule(tenors);
        }
        const ValuationConstants& constants = schedule.constants();

        Size maxMarketIndex = parseSize(XMLUtils::getChildValue(n, "MaxMarketIndex", true));
        Amount claimHaircut = parseSize(XMLUtils::getChildValue(n, "FutureClaimHaircutBps", true)) *
                              constants.basisPoint();
        Amount debtBuffer = parseSize(XMLUtils::getChildValue(n, "DebtBufferBps", true)) * constants.basisPoint();

        vector<QuantLib::Natural> liquidityHaircuts;
        for (const auto& h : XMLUtils::getChildrenValues(n, "LiquidityHaircuts", "Haircut", true))
            liquidityHaircuts.push_back(static_cast<QuantLib::Natural>(parseSize(h)));

        AssetRate assetRate;
        if (XMLNode* a = XMLUtils::getChildNode(n, "AssetRate")) {
            assetRate = AssetRate(parseAmount(XMLUtils::getChildValue(a, "Rate", true)),
                                  parseAmount(XMLUtils::getChildValue(a, "RateDecimals", true)));
        }

        add(QuantLib::ext::make_shared<CashGroup>(currencyId, maxMarketIndex, claimHaircut, debtBuffer,
                                                  liquidityHaircuts, assetRate, schedule));
    }
    LOG("Loaded " << cashGroups_.size() << " cash groups");
}

} // namespace data
} // namespace lend
