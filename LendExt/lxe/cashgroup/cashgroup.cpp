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

#include <lxe/cashgroup/cashgroup.hpp>
#include <lxe/errors.hpp>

namespace LendExt {

CashGroup::CashGroup(CurrencyId currencyId, Size maxMarketIndex, const Amount& claimHaircut, const Amount& debtBuffer,
                     const std::vector<QuantLib::Natural>& liquidityHaircuts, const AssetRate& assetRate,
                     const TenorSchedule& tenorSchedule)
    : currencyId_(currencyId), maxMarketIndex_(maxMarketIndex), claimHaircut_(claimHaircut), debtBuffer_(debtBuffer),
      liquidityHaircuts_(liquidityHaircuts), assetRate_(assetRate), tenorSchedule_(tenorSchedule) {
    QL_REQUIRE(maxMarketIndex_ >= 1 && maxMarketIndex_ <= tenorSchedule_.size(),
               "CashGroup " << currencyId_ << ": max market index " << maxMarketIndex_ << " must be between 1 and "
                            << tenorSchedule_.size());
    QL_REQUIRE(liquidityHaircuts_.size() == maxMarketIndex_,
               "CashGroup " << currencyId_ << ": " << liquidityHaircuts_.size() << " liquidity haircuts given, expected "
                            << maxMarketIndex_);
    for (Size i = 0; i < liquidityHaircuts_.size(); ++i) {
        QL_REQUIRE(liquidityHaircuts_[i] <= 100, "CashGroup " << currencyId_ << ": liquidity haircut "
                                                              << liquidityHaircuts_[i] << " for tier " << i + 1
                                                              << " exceeds 100 percent");
    }
    QL_REQUIRE(claimHaircut_ >= 0 && claimHaircut_ <= constants().ratePrecision,
               "CashGroup " << currencyId_ << ": claim haircut " << claimHaircut_ << " out of range");
    QL_REQUIRE(debtBuffer_ >= 0 && debtBuffer_ <= constants().ratePrecision,
               "CashGroup " << currencyId_ << ": debt buffer " << debtBuffer_ << " out of range");
}

Amount CashGroup::liquidityHaircut(Size tier) const {
    LXE_REQUIRE_CONTRACT(tier >= 1 && tier <= TenorSchedule::maxTiers,
                         "tier " << tier << " out of range, expected 1 to " << TenorSchedule::maxTiers);
    LXE_REQUIRE_CONTRACT(tier <= maxMarketIndex_, "tier " << tier << " is not traded in cash group " << currencyId_
                                                          << ", max market index is " << maxMarketIndex_);
    return Amount(liquidityHaircuts_[tier - 1]);
}

} // namespace LendExt
