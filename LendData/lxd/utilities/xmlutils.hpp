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

/*! \file lxd/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <string>
#include <vector>

// we only need the forward declarations here
namespace rapidxml {
template <class Ch> class xml_node;
template <class Ch> class xml_document;
} // namespace rapidxml

namespace lend {
namespace data {

typedef rapidxml::xml_node<char> XMLNode;

//! Small XML Document wrapper class.
/*! The document owns the character buffer rapidxml parses in place, nodes handed out stay
    valid for the lifetime of the document.
    \ingroup utilities
*/
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const std::string& filename);
    //! destructor
    ~XMLDocument();

    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    //! load a document from a hard-coded string
    void fromXMLString(const std::string& xmlString);

    XMLNode* getFirstNode(const std::string& name) const;

private:
    void parse(const std::string& contents, const std::string& origin);

    rapidxml::xml_document<char>* _doc;
    char* _buffer;
};

//! Base class for all serializable classes
/*! \ingroup utilities
 */
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;

    void fromFile(const std::string& filename);
    void fromXMLString(const std::string& xml);
};

//! XML Utilities Class
/*! \ingroup utilities
 */
class XMLUtils {
public:
    static void checkNode(XMLNode* n, const std::string& expectedName);

    // If mandatory == true, we throw if the node is not present, otherwise we return a default value.
    static std::string getChildValue(XMLNode* node, const std::string& name, bool mandatory = false,
                                     const std::string& defaultValue = std::string());

    //! Values of all grand children called name below the child names
    static std::vector<std::string> getChildrenValues(XMLNode* node, const std::string& names,
                                                      const std::string& name, bool mandatory = false);

    //! Returns the first child node with the given name, or the first child if name is empty
    static XMLNode* getChildNode(XMLNode* n, const std::string& name = "");
    static std::vector<XMLNode*> getChildrenNodes(XMLNode* node, const std::string& name);
    //! Next sibling with the given name, any name if empty
    static XMLNode* getNextSibling(XMLNode* node, const std::string& name = "");

    //! Returns the attribute value, empty if the attribute is missing
    static std::string getAttribute(XMLNode* node, const std::string& attrName);

    static std::string getNodeName(XMLNode* n);
    static std::string getNodeValue(XMLNode* node);
};

} // namespace data
} // namespace lend
