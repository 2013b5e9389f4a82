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

/*! \file lxe/time/valuationconstants.hpp
    \brief Numeric constants of the valuation
    \ingroup time
*/

#pragma once

#include <lxe/types.hpp>

namespace LendExt {

//! Precisions and time units used throughout a valuation
/*! Rates are integers scaled by ratePrecision, so 1% is ratePrecision / 100. Time follows a
    30/360 convention: a month has 30 days, a quarter 90 and a year 360. Annualised rates are
    applied per rateTimeBasis seconds.

    \ingroup time
*/
struct ValuationConstants {
    ValuationConstants()
        : ratePrecision(1000000000), percentagePrecision(100), day(86400), month(30 * day), quarter(90 * day),
          year(360 * day), rateTimeBasis(360 * day) {}

    //! One basis point in rate units
    Amount basisPoint() const { return ratePrecision / 10000; }

    Amount ratePrecision;
    Amount percentagePrecision;
    Timestamp day;
    Timestamp month;
    Timestamp quarter;
    Timestamp year;
    Timestamp rateTimeBasis;
};

} // namespace LendExt
