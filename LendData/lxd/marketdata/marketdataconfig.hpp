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

/*! \file lxd/marketdata/marketdataconfig.hpp
    \brief Market snapshots per currency
    \ingroup marketdata
*/

#pragma once

#include <lxd/utilities/xmlutils.hpp>
#include <lxe/market/cashgroupmarkets.hpp>

#include <ql/shared_ptr.hpp>

#include <map>

namespace lend {
namespace data {
using LendExt::CashGroupMarkets;
using LendExt::CurrencyId;

//! Market data of all currencies as of one valuation time
/*!
  Sample XML
  <pre>
  <MarketData>
    <Currency id="1">
      <CashSupplyRate>20000000</CashSupplyRate>
      <Markets>
        <Market>
          <Maturity>1711929600</Maturity>
          <TotalClaim>1000000000000000000000</TotalClaim>
          <TotalCash>50000000000000</TotalCash>
          <TotalLiquidity>1000000000000000000000</TotalLiquidity>
          <OracleRate>50000000</OracleRate>
        </Market>
      </Markets>
    </Currency>
  </MarketData>
  </pre>
  Markets are listed in tier order. Amounts accept the exponent notation of parseAmount.

  \ingroup marketdata
*/
class MarketDataConfig : public XMLSerializable {
public:
    MarketDataConfig() {}

    bool has(CurrencyId currencyId) const;
    const QuantLib::ext::shared_ptr<CashGroupMarkets>& get(CurrencyId currencyId) const;
    void add(const QuantLib::ext::shared_ptr<CashGroupMarkets>& markets);
    const std::map<CurrencyId, QuantLib::ext::shared_ptr<CashGroupMarkets>>& markets() const { return markets_; }

    void fromXML(XMLNode* node) override;

private:
    std::map<CurrencyId, QuantLib::ext::shared_ptr<CashGroupMarkets>> markets_;
};

} // namespace data
} // namespace lend
