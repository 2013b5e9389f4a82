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

#include <lxe/errors.hpp>
#include <lxe/market/cashgroupmarkets.hpp>

namespace LendExt {

CashGroupMarkets::CashGroupMarkets(CurrencyId currencyId, const std::vector<MarketParameters>& markets,
                                   const Amount& cashSupplyRate)
    : currencyId_(currencyId), markets_(markets), cashSupplyRate_(cashSupplyRate) {
    LXE_REQUIRE_CONTRACT(cashSupplyRate_ >= 0, "negative cash supply rate " << cashSupplyRate_ << " for currency "
                                                                            << currencyId_);
    for (Size i = 0; i < markets_.size(); ++i) {
        const MarketParameters& m = markets_[i];
        LXE_REQUIRE_CONTRACT(m.currencyId == currencyId_, "market " << i + 1 << " belongs to currency " << m.currencyId
                                                                    << ", expected " << currencyId_);
        LXE_REQUIRE_CONTRACT(i == 0 || m.maturity > markets_[i - 1].maturity,
                             "markets of currency " << currencyId_ << " are not ordered by maturity");
        LXE_REQUIRE_CONTRACT(m.totalCash >= 0 && m.totalClaim >= 0 && m.totalLiquidity >= 0,
                             "market " << currencyId_ << "/" << m.maturity << " has negative totals");
        LXE_REQUIRE_CONTRACT(m.oracleRate >= 0,
                             "market " << currencyId_ << "/" << m.maturity << " has negative oracle rate");
    }
}

const MarketParameters& CashGroupMarkets::market(const CashGroup& cashGroup, Size marketIndex, Timestamp now) const {
    LXE_REQUIRE_CONTRACT(cashGroup.currencyId() == currencyId_, "cash group currency " << cashGroup.currencyId()
                                                                << " does not match market currency " << currencyId_);
    LXE_REQUIRE_CONTRACT(marketIndex >= 1 && marketIndex <= cashGroup.maxMarketIndex(),
                         "market index " << marketIndex << " not active in cash group " << currencyId_);
    LXE_REQUIRE_CONTRACT(marketIndex <= markets_.size(),
                         "no market loaded for currency " << currencyId_ << " and tier " << marketIndex);
    const MarketParameters& m = markets_[marketIndex - 1];
    Timestamp expected = cashGroup.tenorSchedule().maturityAtMarketIndex(marketIndex, now);
    LXE_REQUIRE_CONTRACT(m.maturity == expected, "market " << marketIndex << " of currency " << currencyId_
                                                           << " matures at " << m.maturity << ", expected "
                                                           << expected);
    return m;
}

const MarketParameters& CashGroupMarkets::marketForMaturity(const CashGroup& cashGroup, Timestamp maturity,
                                                            Timestamp now) const {
    std::pair<Size, bool> index = cashGroup.tenorSchedule().marketIndex(cashGroup.maxMarketIndex(), maturity, now);
    LXE_REQUIRE_CONTRACT(!index.second, "maturity " << maturity << " is not on the tenor schedule of currency "
                                                    << currencyId_ << " at time " << now);
    return market(cashGroup, index.first, now);
}

Amount CashGroupMarkets::oracleRate(const CashGroup& cashGroup, Timestamp maturity, Timestamp now) const {
    LXE_REQUIRE_CONTRACT(maturity > now, "maturity " << maturity << " is not after the valuation time " << now);

    const TenorSchedule& schedule = cashGroup.tenorSchedule();
    std::pair<Size, bool> index = schedule.marketIndex(cashGroup.maxMarketIndex(), maturity, now);
    if (!index.second)
        return market(cashGroup, index.first, now).oracleRate;

    // the long market is the first one maturing after the asset
    const MarketParameters& longMarket = market(cashGroup, index.first, now);
    if (index.first == 1)
        return interpolateOracleRate(now, longMarket.maturity, cashSupplyRate_, longMarket.oracleRate, maturity);

    const MarketParameters& shortMarket = market(cashGroup, index.first - 1, now);
    return interpolateOracleRate(shortMarket.maturity, longMarket.maturity, shortMarket.oracleRate,
                                 longMarket.oracleRate, maturity);
}

Amount interpolateOracleRate(Timestamp shortMaturity, Timestamp longMaturity, const Amount& shortRate,
                             const Amount& longRate, Timestamp assetMaturity) {
    LXE_REQUIRE_CONTRACT(shortMaturity < assetMaturity && assetMaturity < longMaturity,
                         "cannot interpolate at " << assetMaturity << " between " << shortMaturity << " and "
                                                  << longMaturity);
    if (shortRate == longRate)
        return shortRate;

    Amount elapsed(assetMaturity - shortMaturity);
    Amount span(longMaturity - shortMaturity);
    if (longRate > shortRate) {
        Amount step = SafeInt256::mulDiv(SafeInt256::sub(longRate, shortRate), elapsed, span);
        return SafeInt256::add(shortRate, step);
    } else {
        Amount step = SafeInt256::mulDiv(SafeInt256::sub(shortRate, longRate), elapsed, span);
        return SafeInt256::sub(shortRate, step);
    }
}

} // namespace LendExt
