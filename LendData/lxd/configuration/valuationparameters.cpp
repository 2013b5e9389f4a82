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

#include <lxd/configuration/valuationparameters.hpp>
#include <lxd/utilities/log.hpp>

#include <ql/errors.hpp>

namespace lend {
namespace data {

namespace {
map<string, string> readGroup(XMLNode* groupNode) {
    map<string, string> result;
    for (XMLNode* child = XMLUtils::getChildNode(groupNode); child; child = XMLUtils::getNextSibling(child)) {
        string key = XMLUtils::getAttribute(child, "name");
        QL_REQUIRE(!key.empty(), "parameter without name in group " << XMLUtils::getNodeName(groupNode));
        result[key] = XMLUtils::getNodeValue(child);
    }
    return result;
}
} // namespace

void ValuationParameters::clear() { data_.clear(); }

bool ValuationParameters::hasGroup(const string& groupName) const { return data_.find(groupName) != data_.end(); }

bool ValuationParameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return it->second.find(paramName) != it->second.end();
}

string ValuationParameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
    } else if (!hasGroup(groupName) || !has(groupName, paramName)) {
        return "";
    }
    return data_.find(groupName)->second.find(paramName)->second;
}

const map<string, string>& ValuationParameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void ValuationParameters::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "LendValuation");
    clear();

    XMLNode* setupNode = XMLUtils::getChildNode(node, "Setup");
    QL_REQUIRE(setupNode, "node Setup not found in parameter file");
    data_["setup"] = readGroup(setupNode);

    if (XMLNode* loggingNode = XMLUtils::getChildNode(node, "Logging"))
        data_["logging"] = readGroup(loggingNode);
}

void ValuationParameters::log() const {
    LOG("Parameters:");
    for (const auto& p : data_)
        for (const auto& pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}

} // namespace data
} // namespace lend
