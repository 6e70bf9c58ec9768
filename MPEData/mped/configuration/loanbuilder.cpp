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

#include <mped/configuration/loanbuilder.hpp>
#include <mped/loan/errors.hpp>
#include <mped/utilities/log.hpp>
#include <mped/utilities/parsers.hpp>

using std::map;
using std::string;
using std::vector;

namespace mpe {
namespace data {

namespace {

boost::optional<string> value(const map<string, string>& group, const string& name) {
    auto it = group.find(name);
    if (it == group.end() || it->second.empty())
        return boost::none;
    return it->second;
}

Real realOr(const map<string, string>& group, const string& name, Real defaultValue) {
    auto v = value(group, name);
    return v ? parseReal(*v) : defaultValue;
}

boost::optional<Real> optionalReal(const map<string, string>& group, const string& name) {
    auto v = value(group, name);
    if (!v)
        return boost::none;
    return parseReal(*v);
}

Size sizeOr(const map<string, string>& group, const string& name, Size defaultValue) {
    auto v = value(group, name);
    if (!v)
        return defaultValue;
    Integer i = parseInteger(*v);
    QL_REQUIRE(i >= 0, "parameter " << name << " must be non-negative, got " << i);
    return static_cast<Size>(i);
}

} // namespace

LoanTerms LoanBuilder::loanTerms() const {
    const map<string, string>& loan = params_.data("loan");

    Real principal = parseReal(params_.get("loan", "principal"));
    Real rate = parseReal(params_.get("loan", "annualRatePercent"));
    Date startDate = parseDate(params_.get("loan", "startDate"));

    Size termMonths;
    if (value(loan, "termMonths")) {
        termMonths = sizeOr(loan, "termMonths", 0);
    } else {
        QL_REQUIRE(value(loan, "termYears"), "parameter termMonths or termYears must be given in param group loan");
        termMonths = 12 * sizeOr(loan, "termYears", 0);
    }

    AddOnCosts addOns(realOr(loan, "monthlyTax", 0.0), realOr(loan, "monthlyInsurance", 0.0),
                      realOr(loan, "monthlyHOA", 0.0), realOr(loan, "monthlyPMI", 0.0));

    auto requirePmi = value(loan, "requirePmiRemoval");

    LOG("Building loan terms: principal " << principal << ", rate " << rate << "%, term " << termMonths
                                          << " months");
    return LoanTerms(principal, rate, termMonths, startDate, optionalReal(loan, "homeValue"), addOns,
                     optionalReal(loan, "fixedPayment"), requirePmi ? parseBool(*requirePmi) : false);
}

AmortizationConfig LoanBuilder::amortizationConfig() const {
    if (!params_.hasGroup("engine")) {
        LOG("No engine parameters given, using the default engine configuration");
        return AmortizationConfig();
    }
    const map<string, string>& engine = params_.data("engine");
    AmortizationConfig defaults;

    auto basis = value(engine, "pmiBasis");
    auto timing = value(engine, "pmiTiming");
    auto rounding = value(engine, "paymentRounding");
    auto precision = value(engine, "precision");
    auto accrualPrecision = value(engine, "accrualPrecision");

    PmiPolicy pmiPolicy(realOr(engine, "pmiThreshold", defaults.pmiPolicy().threshold()),
                        basis ? parsePmiBasis(*basis) : defaults.pmiPolicy().basis(),
                        timing ? parsePmiTiming(*timing) : defaults.pmiPolicy().timing());

    return AmortizationConfig(pmiPolicy, precision ? parseInteger(*precision) : defaults.precision(),
                              rounding ? parseRoundingType(*rounding) : defaults.paymentRoundingType(),
                              sizeOr(engine, "maxMonths", defaults.maxMonths()),
                              accrualPrecision ? parseInteger(*accrualPrecision) : defaults.accrualPrecision());
}

PaymentPlan LoanBuilder::buildPaymentPlan(const map<string, string>& group) {
    boost::optional<PaymentPlan::OneTimeExtra> oneTimeExtra;
    auto amount = optionalReal(group, "oneTimeExtraAmount");
    if (amount) {
        auto month = value(group, "oneTimeExtraMonth");
        QL_REQUIRE(month, "oneTimeExtraAmount given without oneTimeExtraMonth");
        Integer m = parseInteger(*month);
        MPE_REQUIRE(InvalidPlanError, m >= 1, "one-time extra payment month is 1-based, got " << m);
        oneTimeExtra = PaymentPlan::OneTimeExtra(static_cast<Size>(m), *amount);
    }
    Integer from = value(group, "effectiveFromMonth") ? parseInteger(*value(group, "effectiveFromMonth")) : 1;
    MPE_REQUIRE(InvalidPlanError, from >= 1, "extra monthly payment effective month is 1-based, got " << from);
    return PaymentPlan(realOr(group, "extraMonthly", 0.0), static_cast<Size>(from), oneTimeExtra);
}

PaymentPlan LoanBuilder::paymentPlan(const string& scenario) const {
    DLOG("Building payment plan for scenario " << scenario);
    return buildPaymentPlan(params_.data(scenario));
}

vector<std::pair<string, PaymentPlan>> LoanBuilder::scenarios() const {
    vector<std::pair<string, PaymentPlan>> result;
    for (const auto& s : params_.scenarios())
        result.push_back(std::make_pair(s, paymentPlan(s)));
    return result;
}

} // namespace data
} // namespace mpe
