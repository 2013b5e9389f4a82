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

/*! \file lxd/configuration/valuationparameters.hpp
    \brief Setup of a valuation run
    \ingroup configuration
*/

#pragma once

#include <lxd/utilities/xmlutils.hpp>

#include <map>
#include <string>

namespace lend {
namespace data {
using std::map;
using std::string;

//! Provides the input data and references to input files used by the lendval application
/*!
  Sample XML
  <pre>
  <LendValuation>
    <Setup>
      <Parameter name="asofTimestamp">1704067200</Parameter>
      <Parameter name="inputPath">Input</Parameter>
      <Parameter name="cashGroupsFile">cashgroups.xml</Parameter>
      <Parameter name="marketDataFile">marketdata.xml</Parameter>
      <Parameter name="portfolioFile">portfolio.xml</Parameter>
      <Parameter name="outputFile">Output/valuation.csv</Parameter>
    </Setup>
    <Logging>
      <Parameter name="logFile">Output/log.txt</Parameter>
      <Parameter name="logMask">31</Parameter>
    </Logging>
  </LendValuation>
  </pre>

  \ingroup configuration
*/
class ValuationParameters : public XMLSerializable {
public:
    ValuationParameters() {}

    void clear();
    void fromXML(XMLNode* node) override;

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;

    void log() const;

private:
    map<string, map<string, string>> data_;
};

} // namespace data
} // namespace lend
