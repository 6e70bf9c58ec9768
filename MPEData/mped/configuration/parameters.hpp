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

/*! \file mped/configuration/parameters.hpp
    \brief Mortgage engine setup, loan, engine and scenario parameters
    \ingroup configuration
*/

#pragma once

#include <map>
#include <vector>

#include <mped/utilities/xmlutils.hpp>

namespace mpe {
namespace data {
using std::map;
using std::string;

//! Provides the input data read from the parameter file used by the mpe application
/*! The file has the layout
    <pre>
    <MPE>
      <Setup>     <Parameter name="logFile">log.txt</Parameter> ... </Setup>
      <Loan>      <Parameter name="principal">180000</Parameter> ... </Loan>
      <Engine>    <Parameter name="pmiThreshold">0.8</Parameter> ... </Engine>
      <Scenarios>
        <Scenario name="Extra200"> <Parameter name="extraMonthly">200</Parameter> ... </Scenario>
      </Scenarios>
    </MPE>
    </pre>
    Setup and Loan are mandatory. Groups are stored under the names "setup", "loan", "engine" and one group per
    scenario, named after the scenario.

    \ingroup configuration
 */
class Parameters : public XMLSerializable {
public:
    Parameters() {}

    void clear();
    void fromFile(const string&);
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;

    //! Scenario names in file order
    const std::vector<string>& scenarios() const { return scenarios_; }

    //! Set a parameter, creating the group if needed
    void set(const string& groupName, const string& paramName, const string& value);
    //! Add a scenario group, its parameters can be set with set() afterwards
    void addScenario(const string& name);

    void log();

private:
    map<string, map<string, string>> data_;
    std::vector<string> scenarios_;
};
} // namespace data
} // namespace mpe
