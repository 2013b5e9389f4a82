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

/*! \file lxe/math/safeint256.hpp
    \brief Checked arithmetic on signed 256 bit amounts
    \ingroup math
*/

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace LendExt {

//! Signed amount, notionals, market totals and rates are all carried in this type
/*! Values are kept inside the two's complement range [-2^255, 2^255 - 1]. The
    operations in SafeInt256 check every result against that range.
*/
typedef boost::multiprecision::int256_t Amount;

namespace SafeInt256 {

//! 2^255 - 1
const Amount& max();
//! -2^255
const Amount& min();

//! true if x is inside the signed 256 bit range
bool inRange(const Amount& x);

Amount add(const Amount& x, const Amount& y);
Amount sub(const Amount& x, const Amount& y);
Amount mul(const Amount& x, const Amount& y);

//! Truncating division, throws ArithmeticFault on a zero divisor
Amount div(const Amount& x, const Amount& y);

Amount neg(const Amount& x);

//! x * y / precision, the product is checked before dividing
Amount mulDiv(const Amount& x, const Amount& y, const Amount& precision);

} // namespace SafeInt256
} // namespace LendExt
