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

/*! \file lxe/cashgroup/assetrate.hpp
    \brief Conversion between underlying and native denomination of a currency
    \ingroup cashgroup
*/

#pragma once

#include <lxe/types.hpp>

namespace LendExt {

//! Linear conversion between the underlying and the native (asset) denomination
/*! One unit of native denomination is worth rate / rateDecimals units of underlying.
    The identity rate has rate == rateDecimals.

    \ingroup cashgroup
*/
class AssetRate {
public:
    //! Identity rate with 18 decimals
    AssetRate();
    AssetRate(const Amount& rate, const Amount& rateDecimals);

    const Amount& rate() const { return rate_; }
    const Amount& rateDecimals() const { return rateDecimals_; }

    //! underlying * rateDecimals / rate
    Amount convertFromUnderlying(const Amount& underlying) const;
    //! asset * rate / rateDecimals
    Amount convertToUnderlying(const Amount& asset) const;

private:
    Amount rate_;
    Amount rateDecimals_;
};

} // namespace LendExt
