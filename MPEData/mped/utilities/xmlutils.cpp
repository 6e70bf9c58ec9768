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

#include <mped/utilities/log.hpp>
#include <mped/utilities/xmlutils.hpp>

#include <ql/errors.hpp>
#include <ql/types.hpp>

#include <rapidxml.hpp>

#include <cstring>
#include <fstream>
#include <sstream>

using namespace std;
using namespace rapidxml;
using QuantLib::Size;

namespace mpe {
namespace data {

namespace {

// rapidxml_print does not compile with recent compilers, the documents we write are simple enough to
// serialise by hand: elements, attributes and text values only.
string escape(const string& s) {
    string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

void print(std::ostream& out, const XMLNode* node, Size indent) {
    const string pad(indent * 2, ' ');
    out << pad << '<' << string(node->name(), node->name_size());
    for (const xml_attribute<char>* a = node->first_attribute(); a; a = a->next_attribute())
        out << ' ' << string(a->name(), a->name_size()) << "=\"" << escape(string(a->value(), a->value_size()))
            << '"';
    const XMLNode* child = node->first_node();
    if (!child) {
        if (node->value_size() == 0)
            out << "/>\n";
        else
            out << '>' << escape(string(node->value(), node->value_size())) << "</"
                << string(node->name(), node->name_size()) << ">\n";
        return;
    }
    if (child->type() == node_data && !child->next_sibling()) {
        out << '>' << escape(string(child->value(), child->value_size())) << "</"
            << string(node->name(), node->name_size()) << ">\n";
        return;
    }
    out << ">\n";
    for (; child; child = child->next_sibling()) {
        if (child->type() == node_element)
            print(out, child, indent + 1);
    }
    out << pad << "</" << string(node->name(), node->name_size()) << ">\n";
}

} // namespace

XMLDocument::XMLDocument() : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {}

XMLDocument::XMLDocument(const string& fileName) : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {
    // Need to load the entire file into memory to pass to doc.parse().
    ifstream t(fileName.c_str());
    QL_REQUIRE(t.is_open(), "Failed to open file " << fileName);
    t.seekg(0, std::ios::end);                   // go to the end
    Size length = static_cast<Size>(t.tellg()); // report location (this is the length)
    QL_REQUIRE(length > 0, "File " << fileName << " is empty.");
    t.seekg(0, std::ios::beg);    // go back to the beginning
    _buffer = new char[length + 1]; // allocate memory for a buffer of appropriate dimension
    t.read(_buffer, length);      // read the whole file into the buffer
    _buffer[static_cast<int>(t.gcount())] = '\0';
    t.close(); // close file handle
    try {
        _doc->parse<0>(_buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where = string(pe.where<char>()).substr(0, 30);
        QL_FAIL("RapidXML Parse Error in " << fileName << " : " << pe.what() << ". where=" << where);
    }
}

XMLDocument::~XMLDocument() {
    if (_buffer != NULL)
        delete[] _buffer;
    if (_doc != NULL)
        delete _doc;
}

void XMLDocument::fromXMLString(const string& xmlString) {
    QL_REQUIRE(!_buffer, "XML Document is already loaded");
    Size length = xmlString.size();
    _buffer = new char[length + 1];
    strcpy(_buffer, xmlString.c_str());
    _buffer[length] = '\0';
    try {
        _doc->parse<0>(_buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where = string(pe.where<char>()).substr(0, 30);
        QL_FAIL("RapidXML Parse Error : " << pe.what() << ". where=" << where);
    }
}

XMLNode* XMLDocument::getFirstNode(const string& name) const {
    return _doc->first_node(name == "" ? NULL : name.c_str());
}

void XMLDocument::appendNode(XMLNode* node) { _doc->append_node(node); }

void XMLDocument::toFile(const string& fileName) const {
    std::ofstream ofs(fileName.c_str());
    QL_REQUIRE(ofs.is_open(), "Failed to open file " << fileName << " for writing");
    ofs << toString();
    ofs.close();
}

string XMLDocument::toString() const {
    std::ostringstream oss;
    for (const XMLNode* node = _doc->first_node(); node; node = node->next_sibling())
        print(oss, node, 0);
    return oss.str();
}

XMLNode* XMLDocument::allocNode(const string& nodeName) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& value) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName), allocString(value));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

char* XMLDocument::allocString(const string& str) {
    char* s = _doc->allocate_string(str.c_str());
    QL_REQUIRE(s, "Failed to allocate string for " << str);
    return s;
}

xml_attribute<char>* XMLDocument::allocAttribute(const string& name, const string& value) {
    xml_attribute<char>* a = _doc->allocate_attribute(allocString(name), allocString(value));
    QL_REQUIRE(a, "Failed to allocate attribute " << name);
    return a;
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(node->name() == expectedName,
               "XML Node name " << node->name() << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLDocument& doc, XMLNode* parent, const string& name) {
    QL_REQUIRE(parent, "XML Parent Node is NULL (adding Child " << name << ")");
    XMLNode* node = doc.allocNode(name);
    parent->append_node(node);
    return node;
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* parent, const string& name, const string& value) {
    QL_REQUIRE(parent, "XML Parent Node is NULL (adding Child " << name << ")");
    if (value.size() == 0) {
        addChild(doc, parent, name);
    } else {
        XMLNode* node = doc.allocNode(name, value);
        parent->append_node(node);
    }
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XML Parent Node is NULL (adding Child " << child->name() << ")");
    parent->append_node(child);
}

void XMLUtils::addAttribute(XMLDocument& doc, XMLNode* node, const string& attrName, const string& attrValue) {
    QL_REQUIRE(node, "XML Node is NULL (adding Attribute " << attrName << ")");
    node->append_attribute(doc.allocAttribute(attrName, attrValue));
}

string XMLUtils::getAttribute(XMLNode* node, const string& attrName) {
    QL_REQUIRE(node, "XMLNode is NULL (was looking for attribute " << attrName << ")");
    xml_attribute<>* attr = node->first_attribute(attrName.c_str());
    if (attr && attr->value())
        return attr->value();
    else
        return "";
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    return n->first_node(name == "" ? NULL : name.c_str());
}

XMLNode* XMLUtils::getNextSibling(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getNextSibling(" << name << "): XML Node is NULL");
    return n->next_sibling(name == "" ? NULL : name.c_str());
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << ") node is NULL");
    vector<XMLNode*> res;
    const char* p = name.size() == 0 ? nullptr : name.c_str();
    for (xml_node<>* c = node->first_node(p); c; c = c->next_sibling(p))
        res.push_back(c);
    return res;
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return string(node->name(), node->name_size());
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    // handle CDATA nodes
    XMLNode* n = node->first_node();
    if (n && n->type() == node_cdata)
        return n->value();
    // all other cases
    return node->value();
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    QL_REQUIRE(node, "XMLNode is NULL (was looking for child " << name << ")");
    xml_node<>* child = node->first_node(name.c_str());
    if (mandatory) {
        QL_REQUIRE(child, "Error: No XML Child Node " << name << " found.");
    }
    return child ? getNodeValue(child) : defaultValue;
}

} // namespace data
} // namespace mpe
