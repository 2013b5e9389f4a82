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

/*! \file lxe/math/fixedpoint64x64.hpp
    \brief Signed 64.64 binary fixed point arithmetic
    \ingroup math
*/

#pragma once

#include <lxe/math/safeint256.hpp>

namespace LendExt {

//! Signed 64.64 binary fixed point numbers
/*! A value v represents v / 2^64. Every result is required to lie in [-2^127, 2^127 - 1],
    anything outside raises an ArithmeticFault. The results are reproducible bit by bit,
    no floating point is involved.

    \ingroup math
*/
class FixedPoint64x64 {
public:
    typedef boost::multiprecision::int256_t Value;

    //! -2^127
    static const Value& minValue();
    //! 2^127 - 1
    static const Value& maxValue();
    //! 1.0, i.e. 2^64
    static const Value& one();

    //! x must be in [0, 2^63 - 1]
    static Value fromUInt(const Amount& x);
    //! Integer part, rounded towards minus infinity
    static Amount toInt(const Value& x);

    static Value neg(const Value& x);
    //! Product, rounded towards minus infinity
    static Value mul(const Value& x, const Value& y);
    //! Quotient, rounded towards zero
    static Value div(const Value& x, const Value& y);

    //! 2^x, for x < 64, 0 for x < -64
    static Value exp2(const Value& x);
    //! e^x, for x < 64, 0 for x < -64
    static Value exp(const Value& x);
};

} // namespace LendExt
