/*
 Copyright (C) 2025 The MPE Authors
 All rights reserved.

 This file is part of MPE, a free-software/open-source library
 for mortgage amortization and payoff projection

 MPE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program, see the LICENSE file.

 This program is distributed in the hope that it will be useful, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file mped/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <string>
#include <vector>

// forward declarations, the rapidxml headers are only included by the implementation
namespace rapidxml {
template <class Ch> class xml_node;
template <class Ch> class xml_document;
template <class Ch> class xml_attribute;
} // namespace rapidxml

namespace mpe {
namespace data {
using std::string;
using std::vector;

typedef rapidxml::xml_node<char> XMLNode;

//! Small XML Document wrapper class.
/*!
  \ingroup utilities
*/
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const string& filename);
    //! destructor
    ~XMLDocument();

    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    //! load a document from a hard-coded string
    void fromXMLString(const string& xmlString);

    XMLNode* getFirstNode(const string& name) const;
    void appendNode(XMLNode*);

    //! save the XML Document to the given file.
    void toFile(const string& filename) const;

    string toString() const;

    // MPE functions
    XMLNode* allocNode(const string& nodeName);
    XMLNode* allocNode(const string& nodeName, const string& value);
    char* allocString(const string& str);
    rapidxml::xml_attribute<char>* allocAttribute(const string& name, const string& value);

private:
    rapidxml::xml_document<char>* _doc;
    char* _buffer;
};

//! Base class for all serializable classes
/*!
  \ingroup utilities
*/
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;
    virtual XMLNode* toXML(XMLDocument& doc) const = 0;

    void fromFile(const std::string& filename);
    void toFile(const std::string& filename) const;

    //! Parse from XML string
    void fromXMLString(const std::string& xml);
    //! Parse from XML string
    std::string toXMLString() const;
};

//! XML Utilities Class
/*!
  \ingroup utilities
*/
class XMLUtils {
public:
    static void checkNode(XMLNode* n, const string& expectedName);

    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const string& name);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, const string& value);
    static void appendNode(XMLNode* parent, XMLNode* child);

    static void addAttribute(XMLDocument& doc, XMLNode* n, const string& attrName, const string& attrValue);
    static string getAttribute(XMLNode* node, const string& attrName);

    //! Get a node's compulsory child node
    static XMLNode* getChildNode(XMLNode* n, const string& name = "");
    static XMLNode* getNextSibling(XMLNode* node, const string& name = "");
    static vector<XMLNode*> getChildrenNodes(XMLNode* node, const string& name);

    //! Get a node's value
    static string getNodeName(XMLNode* n);
    static string getNodeValue(XMLNode* node);
    static string getChildValue(XMLNode* node, const string& name, bool mandatory = false,
                                const string& defaultValue = string());
};

} // namespace data
} // namespace mpe
