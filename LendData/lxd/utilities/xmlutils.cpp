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

#include <lxd/utilities/log.hpp>
#include <lxd/utilities/xmlutils.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <ql/errors.hpp>

// we include rapid xml headers here
#include <rapidxml.hpp>

#include <cstring>
#include <fstream>
#include <sstream>

using namespace std;
using namespace rapidxml;

namespace lend {
namespace data {

XMLDocument::XMLDocument() : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {}

XMLDocument::XMLDocument(const string& fileName) : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {
    // Need to load the entire file into memory to pass to doc.
    ifstream t(fileName.c_str());
    if (!t.is_open()) {
        delete _doc;
        QL_FAIL("Failed to open file " << fileName);
    }
    stringstream buffer;
    buffer << t.rdbuf();
    try {
        parse(buffer.str(), fileName);
    } catch (...) {
        delete _doc;
        delete[] _buffer;
        throw;
    }
    DLOG("Loaded XML file " << fileName);
}

XMLDocument::~XMLDocument() {
    if (_buffer != NULL)
        delete[] _buffer;
    if (_doc != NULL)
        delete _doc;
}

void XMLDocument::fromXMLString(const string& xmlString) {
    QL_REQUIRE(!_buffer, "XML Document is already loaded");
    parse(xmlString, "string");
}

void XMLDocument::parse(const string& contents, const string& origin) {
    _buffer = new char[contents.size() + 1];
    strcpy(_buffer, contents.c_str());
    _buffer[contents.size()] = '\0';
    try {
        _doc->parse<0>(_buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where(pe.where<char>(), strnlen(pe.where<char>(), 30));
        QL_FAIL("rapidxml parse error in " << origin << " : " << pe.what() << " at '" << where << "'");
    }
}

XMLNode* XMLDocument::getFirstNode(const string& name) const {
    return _doc->first_node(name == "" ? NULL : name.c_str());
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(node->name() == expectedName,
               "XML Node name " << node->name() << " does not match expected name " << expectedName);
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    QL_REQUIRE(node, "XMLNode is NULL (was looking for child " << name << ")");
    XMLNode* child = node->first_node(name.c_str());
    if (mandatory) {
        QL_REQUIRE(child, "Error: No XML Child Node " << name << " found.");
    }
    return child ? getNodeValue(child) : defaultValue;
}

vector<string> XMLUtils::getChildrenValues(XMLNode* parent, const string& names, const string& name,
                                           bool mandatory) {
    vector<string> vec;
    XMLNode* node = parent->first_node(names.c_str());
    if (mandatory) {
        QL_REQUIRE(node, "Error: No XML Node " << names << " found.");
    }
    if (node) {
        for (XMLNode* child = node->first_node(name.c_str()); child; child = child->next_sibling(name.c_str()))
            vec.push_back(getNodeValue(child));
    }
    return vec;
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    return n->first_node(name == "" ? NULL : name.c_str());
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    const char* p = name.size() == 0 ? nullptr : name.c_str();
    for (XMLNode* c = node->first_node(p); c; c = c->next_sibling(p))
        res.push_back(c);
    return res;
}

XMLNode* XMLUtils::getNextSibling(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getNextSibling(" << name << "): XML Node is NULL");
    return node->next_sibling(name == "" ? NULL : name.c_str());
}

string XMLUtils::getAttribute(XMLNode* node, const string& attrName) {
    QL_REQUIRE(node, "XMLUtils::getAttribute(" << attrName << "): XML Node is NULL");
    xml_attribute<char>* attr = node->first_attribute(attrName.c_str());
    if (attr && attr->value())
        return string(attr->value());
    return "";
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return node->name();
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    // handle CDATA nodes
    XMLNode* n = node->first_node();
    if (n && n->type() == node_cdata)
        return boost::algorithm::trim_copy(string(n->value()));
    // all other cases
    return boost::algorithm::trim_copy(string(node->value()));
}

} // namespace data
} // namespace lend
