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

/*! \file lxe/cashgroup/cashgroup.hpp
    \brief Risk parameters of one currency
    \ingroup cashgroup
*/

#pragma once

#include <lxe/cashgroup/assetrate.hpp>
#include <lxe/time/tenorschedule.hpp>

#include <vector>

namespace LendExt {

//! Risk and market configuration of one currency
/*! The claim haircut and the debt buffer are rates in units of the rate precision. They
    widen the discount rate of positive resp. negative future claims. Liquidity haircuts are
    percentages in [0, 100], one per active tier.

    \ingroup cashgroup
*/
class CashGroup {
public:
    CashGroup(CurrencyId currencyId, Size maxMarketIndex, const Amount& claimHaircut, const Amount& debtBuffer,
              const std::vector<QuantLib::Natural>& liquidityHaircuts, const AssetRate& assetRate = AssetRate(),
              const TenorSchedule& tenorSchedule = TenorSchedule());

    //! \name Inspectors
    //@{
    CurrencyId currencyId() const { return currencyId_; }
    //! Number of active markets, the tiers 1 to maxMarketIndex are traded
    Size maxMarketIndex() const { return maxMarketIndex_; }
    const Amount& claimHaircut() const { return claimHaircut_; }
    const Amount& debtBuffer() const { return debtBuffer_; }
    const std::vector<QuantLib::Natural>& liquidityHaircuts() const { return liquidityHaircuts_; }
    const AssetRate& assetRate() const { return assetRate_; }
    const TenorSchedule& tenorSchedule() const { return tenorSchedule_; }
    const ValuationConstants& constants() const { return tenorSchedule_.constants(); }
    //@}

    //! Liquidity haircut percentage of the given tier, tier must be an active tier
    Amount liquidityHaircut(Size tier) const;

    //! Converts an underlying denominated amount into the native denomination
    Amount convertFromUnderlying(const Amount& underlying) const {
        return assetRate_.convertFromUnderlying(underlying);
    }

private:
    CurrencyId currencyId_;
    Size maxMarketIndex_;
    Amount claimHaircut_;
    Amount debtBuffer_;
    std::vector<QuantLib::Natural> liquidityHaircuts_;
    AssetRate assetRate_;
    TenorSchedule tenorSchedule_;
};

} // namespace LendExt
