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

/*! \file lxe/types.hpp
    \brief Basic types shared by the valuation engine
*/

#pragma once

#include <lxe/math/safeint256.hpp>
#include <ql/types.hpp>

#include <cstdint>

namespace LendExt {

//! Seconds since the epoch
typedef std::uint64_t Timestamp;

//! Identifies a currency and with it its cash group and markets
typedef QuantLib::Natural CurrencyId;

using QuantLib::Size;

} // namespace LendExt
