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

#include <lxd/utilities/parsers.hpp>
#include <lxe/time/tenorschedule.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/errors.hpp>
#include <ql/utilities/dataparsers.hpp>

#include <algorithm>
#include <vector>

using namespace std;
using boost::iequals;

namespace lend {
namespace data {

namespace {
bool isDigits(const string& s) {
    return !s.empty() && s.find_first_not_of("0123456789") == string::npos;
}
} // namespace

Amount parseAmount(const string& str) {
    string s = boost::trim_copy(str);
    QL_REQUIRE(!s.empty(), "Failed to parse amount: empty string");

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        s = s.substr(1);
    }

    string mantissa = s;
    Size exponent = 0;
    string::size_type e = s.find_first_of("eE");
    if (e != string::npos) {
        mantissa = s.substr(0, e);
        string exp = s.substr(e + 1);
        if (!exp.empty() && exp[0] == '+')
            exp = exp.substr(1);
        QL_REQUIRE(isDigits(exp) && exp.size() <= 2, "Failed to parse amount '" << str << "': invalid exponent");
        exponent = boost::lexical_cast<Size>(exp);
    }

    string::size_type dot = mantissa.find('.');
    if (dot != string::npos) {
        string fraction = boost::trim_right_copy_if(mantissa.substr(dot + 1), boost::is_any_of("0"));
        QL_REQUIRE(fraction.size() <= exponent,
                   "Failed to parse amount '" << str << "': value is not an integer");
        exponent -= fraction.size();
        mantissa = mantissa.substr(0, dot) + fraction;
    }
    QL_REQUIRE(isDigits(mantissa), "Failed to parse amount '" << str << "'");

    // a leading zero would make the multiprecision parser read octal
    string digits = boost::trim_left_copy_if(mantissa, boost::is_any_of("0")) + string(exponent, '0');
    if (digits.empty() || digits[0] == '0')
        digits = "0";
    // 2^255 has 77 digits, leave the exact bound to the range check below
    QL_REQUIRE(digits.size() <= 80, "Failed to parse amount '" << str << "': too many digits");
    boost::multiprecision::int512_t value(digits);
    if (negative)
        value = -value;
    QL_REQUIRE(value >= boost::multiprecision::int512_t(LendExt::SafeInt256::min()) &&
                   value <= boost::multiprecision::int512_t(LendExt::SafeInt256::max()),
               "Failed to parse amount '" << str << "': out of the 256 bit range");
    return static_cast<Amount>(value);
}

Timestamp parseTimestamp(const string& str) {
    string s = boost::trim_copy(str);
    QL_REQUIRE(isDigits(s), "Failed to parse timestamp '" << str << "'");
    try {
        return boost::lexical_cast<Timestamp>(s);
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parse timestamp '" << str << "'");
    }
}

QuantLib::Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<QuantLib::Integer>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parse integer " << s);
    }
}

Size parseSize(const string& s) {
    QuantLib::Integer i = parseInteger(s);
    QL_REQUIRE(i >= 0, "Failed to parse " << s << " as a non-negative integer");
    return static_cast<Size>(i);
}

bool parseBool(const string& s) {
    static const vector<string> trueStrings = {"Y", "YES", "TRUE", "true", "1"};
    static const vector<string> falseStrings = {"N", "NO", "FALSE", "false", "0"};
    string t = boost::trim_copy(s);
    if (std::find(trueStrings.begin(), trueStrings.end(), t) != trueStrings.end())
        return true;
    if (std::find(falseStrings.begin(), falseStrings.end(), t) != falseStrings.end())
        return false;
    QL_FAIL("Cannot convert \"" << s << "\" to bool");
}

Size parseTier(const string& s) {
    Size tier = parseSize(s);
    QL_REQUIRE(tier >= 1 && tier <= LendExt::TenorSchedule::maxTiers,
               "Tier " << tier << " out of range 1.." << LendExt::TenorSchedule::maxTiers);
    return tier;
}

QuantLib::Period parsePeriod(const string& s) { return QuantLib::PeriodParser::parse(boost::trim_copy(s)); }

LendExt::Position::Kind parsePositionKind(const string& s) {
    string t = boost::trim_copy(s);
    if (iequals(t, "FutureClaim"))
        return LendExt::Position::Kind::FutureClaim;
    if (iequals(t, "PooledLiquidity"))
        return LendExt::Position::Kind::PooledLiquidity;
    QL_FAIL("Position kind \"" << s << "\" not recognized");
}

} // namespace data
} // namespace lend
