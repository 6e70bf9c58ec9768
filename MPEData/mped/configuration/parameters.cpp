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

#include <mped/configuration/parameters.hpp>

#include <mped/utilities/log.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using std::string;
using std::vector;

namespace mpe {
namespace data {

namespace {
const vector<std::pair<string, string>> fixedGroups = {{"Setup", "setup"}, {"Loan", "loan"}, {"Engine", "engine"}};

map<string, string> readGroup(XMLNode* groupNode) {
    map<string, string> group;
    for (XMLNode* child = XMLUtils::getChildNode(groupNode); child; child = XMLUtils::getNextSibling(child)) {
        string key = XMLUtils::getAttribute(child, "name");
        QL_REQUIRE(!key.empty(), "parameter without name attribute in group " << XMLUtils::getNodeName(groupNode));
        string value = XMLUtils::getNodeValue(child);
        group[key] = value;
    }
    return group;
}

void writeGroup(XMLDocument& doc, XMLNode* groupNode, const map<string, string>& group) {
    for (const auto& p : group) {
        XMLNode* paramNode = doc.allocNode("Parameter", p.second);
        XMLUtils::appendNode(groupNode, paramNode);
        XMLUtils::addAttribute(doc, paramNode, "name", p.first);
    }
}
} // namespace

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return (it->second.find(paramName) != it->second.end());
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    } else {
        if (!hasGroup(groupName) || !has(groupName, paramName))
            return "";
        else {
            auto it = data_.find(groupName);
            return it->second.find(paramName)->second;
        }
    }
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void Parameters::set(const string& groupName, const string& paramName, const string& value) {
    data_[groupName][paramName] = value;
}

void Parameters::addScenario(const string& name) {
    QL_REQUIRE(!name.empty(), "scenario name must not be empty");
    QL_REQUIRE(std::find(scenarios_.begin(), scenarios_.end(), name) == scenarios_.end(),
               "duplicate scenario name '" << name << "'");
    for (const auto& g : fixedGroups)
        QL_REQUIRE(name != g.second, "scenario name '" << name << "' is reserved");
    scenarios_.push_back(name);
    data_[name];
}

void Parameters::fromFile(const string& fileName) {
    LOG("load MPE configuration from " << fileName);
    clear();
    XMLDocument doc(fileName);
    fromXML(doc.getFirstNode("MPE"));
    LOG("load MPE configuration from " << fileName << " done.");
}

void Parameters::clear() {
    data_.clear();
    scenarios_.clear();
}

void Parameters::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "MPE");
    clear();

    for (const auto& g : fixedGroups) {
        XMLNode* groupNode = XMLUtils::getChildNode(node, g.first);
        if (groupNode)
            data_[g.second] = readGroup(groupNode);
    }
    QL_REQUIRE(hasGroup("setup"), "node Setup not found in parameter file");
    QL_REQUIRE(hasGroup("loan"), "node Loan not found in parameter file");

    XMLNode* scenariosNode = XMLUtils::getChildNode(node, "Scenarios");
    if (scenariosNode) {
        for (XMLNode* child : XMLUtils::getChildrenNodes(scenariosNode, "Scenario")) {
            string name = XMLUtils::getAttribute(child, "name");
            addScenario(name);
            data_[name] = readGroup(child);
        }
    }
}

XMLNode* Parameters::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("MPE");
    for (const auto& g : fixedGroups) {
        if (hasGroup(g.second))
            writeGroup(doc, XMLUtils::addChild(doc, node, g.first), data(g.second));
    }
    if (!scenarios_.empty()) {
        XMLNode* scenariosNode = XMLUtils::addChild(doc, node, "Scenarios");
        for (const auto& s : scenarios_) {
            XMLNode* scenarioNode = XMLUtils::addChild(doc, scenariosNode, "Scenario");
            XMLUtils::addAttribute(doc, scenarioNode, "name", s);
            writeGroup(doc, scenarioNode, data(s));
        }
    }
    return node;
}

void Parameters::log() {
    LOG("Parameters:");
    for (auto p : data_)
        for (auto pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}
} // namespace data
} // namespace mpe
