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

/*! \file lxd/utilities/parsers.hpp
    \brief string utilities for parsing
    \ingroup utilities
*/

#pragma once

#include <lxe/instruments/position.hpp>
#include <lxe/types.hpp>

#include <ql/time/period.hpp>

#include <string>

namespace lend {
namespace data {
using LendExt::Amount;
using LendExt::Timestamp;
using QuantLib::Size;

//! Convert text to LendExt::Amount
/*!
  Accepts a signed integer ("-250000"), optionally with a non-negative decimal exponent
  ("1e18", "-2.5e17") as long as the result is integral.
  \ingroup utilities
 */
Amount parseAmount(const std::string& s);

//! Convert text to a timestamp in seconds
/*!
  \ingroup utilities
 */
Timestamp parseTimestamp(const std::string& s);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
 */
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to a non-negative QuantLib::Size
/*!
  \ingroup utilities
 */
Size parseSize(const std::string& s);

//! Convert text to bool
/*!
  \ingroup utilities
 */
bool parseBool(const std::string& s);

//! Convert text to a market tier in 1..9
/*!
  \ingroup utilities
 */
Size parseTier(const std::string& s);

//! Convert text to QuantLib::Period
/*!
  \ingroup utilities
 */
QuantLib::Period parsePeriod(const std::string& s);

//! Convert "FutureClaim" or "PooledLiquidity" to the position kind
/*!
  \ingroup utilities
 */
LendExt::Position::Kind parsePositionKind(const std::string& s);

} // namespace data
} // namespace lend
