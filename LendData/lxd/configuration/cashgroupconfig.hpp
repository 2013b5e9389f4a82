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

/*! \file lxd/configuration/cashgroupconfig.hpp
    \brief Cash group parameters per currency
    \ingroup configuration
*/

#pragma once

#include <lxd/utilities/xmlutils.hpp>
#include <lxe/cashgroup/cashgroup.hpp>

#include <ql/shared_ptr.hpp>

#include <map>

namespace lend {
namespace data {
using LendExt::CashGroup;
using LendExt::CurrencyId;

//! Container for the cash groups of all currencies
/*!
  Sample XML
  <pre>
  <CashGroups>
    <CashGroup currencyId="1">
      <MaxMarketIndex>2</MaxMarketIndex>
      <FutureClaimHaircutBps>150</FutureClaimHaircutBps>
      <DebtBufferBps>150</DebtBufferBps>
      <LiquidityHaircuts>
        <Haircut>97</Haircut>
        <Haircut>95</Haircut>
      </LiquidityHaircuts>
      <!-- optional, identity rate with 18 decimals by default -->
      <AssetRate>
        <Rate>200000000000000000000000000</Rate>
        <RateDecimals>10000000000000000000000000000</RateDecimals>
      </AssetRate>
      <!-- optional, the nine standard tenors by default -->
      <Tenors>
        <Tenor>3M</Tenor>
        <Tenor>6M</Tenor>
      </Tenors>
    </CashGroup>
  </CashGroups>
  </pre>
  Haircut and buffer are given in basis points and stored in rate precision units.

  \ingroup configuration
*/
class CashGroupConfigurations : public XMLSerializable {
public:
    CashGroupConfigurations() {}

    bool has(CurrencyId currencyId) const;
    const QuantLib::ext::shared_ptr<CashGroup>& get(CurrencyId currencyId) const;
    void add(const QuantLib::ext::shared_ptr<CashGroup>& cashGroup);
    const std::map<CurrencyId, QuantLib::ext::shared_ptr<CashGroup>>& cashGroups() const { return cashGroups_; }

    void fromXML(XMLNode* node) override;

private:
    std::map<CurrencyId, QuantLib::ext::shared_ptr<CashGroup>> cashGroups_;
};

} // namespace data
} // namespace lend
