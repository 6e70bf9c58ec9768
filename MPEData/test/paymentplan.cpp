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

#include <boost/test/unit_test.hpp>
#include <mped/loan/errors.hpp>
#include <mped/loan/loanterms.hpp>
#include <mped/loan/paymentplan.hpp>
#include <mpet/toplevelfixture.hpp>

#include <limits>

using namespace mpe::data;
using QuantLib::Date;

BOOST_FIXTURE_TEST_SUITE(MPEDataTestSuite, mpe::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(PaymentPlanTests)

BOOST_AUTO_TEST_CASE(testNoExtraPayments) {
    BOOST_TEST_MESSAGE("Testing the plan without extra payments...");
    PaymentPlan plan = PaymentPlan::none();
    BOOST_CHECK(!plan.hasExtraPayments());
    BOOST_CHECK_EQUAL(plan.extraMonthly(), 0.0);
    BOOST_CHECK_EQUAL(plan.effectiveFromMonth(), 1);
    BOOST_CHECK(!plan.oneTimeExtra());
    for (Size i = 1; i <= 12; ++i)
        BOOST_CHECK_EQUAL(plan.extra(i), 0.0);
}

BOOST_AUTO_TEST_CASE(testExtraAmounts) {
    BOOST_TEST_MESSAGE("Testing requested extra amounts per period...");
    PaymentPlan plan(200.0, 3, PaymentPlan::OneTimeExtra(4, 5000.0));
    BOOST_CHECK(plan.hasExtraPayments());
    BOOST_CHECK_EQUAL(plan.extra(1), 0.0);
    BOOST_CHECK_EQUAL(plan.extra(2), 0.0);
    BOOST_CHECK_EQUAL(plan.extra(3), 200.0);
    BOOST_CHECK_EQUAL(plan.extra(4), 5200.0);
    BOOST_CHECK_EQUAL(plan.extra(5), 200.0);

    PaymentPlan oneTimeOnly(0.0, 1, PaymentPlan::OneTimeExtra(1, 1000.0));
    BOOST_CHECK(oneTimeOnly.hasExtraPayments());
    BOOST_CHECK_EQUAL(oneTimeOnly.extra(1), 1000.0);
    BOOST_CHECK_EQUAL(oneTimeOnly.extra(2), 0.0);

    PaymentPlan zeroOneTime(0.0, 1, PaymentPlan::OneTimeExtra(1, 0.0));
    BOOST_CHECK(!zeroOneTime.hasExtraPayments());
}

BOOST_AUTO_TEST_CASE(testInvalidPlans) {
    BOOST_TEST_MESSAGE("Testing rejection of malformed plans...");
    BOOST_CHECK_THROW(PaymentPlan(-1.0), InvalidPlanError);
    BOOST_CHECK_THROW(PaymentPlan(100.0, 0), InvalidPlanError);
    BOOST_CHECK_THROW(PaymentPlan(0.0, 1, PaymentPlan::OneTimeExtra(1, -10.0)), InvalidPlanError);
    BOOST_CHECK_THROW(PaymentPlan(0.0, 1, PaymentPlan::OneTimeExtra(0, 10.0)), InvalidPlanError);
    BOOST_CHECK_THROW(PaymentPlan(std::numeric_limits<double>::quiet_NaN()), InvalidPlanError);
}

BOOST_AUTO_TEST_CASE(testValidateAgainstLoan) {
    BOOST_TEST_MESSAGE("Testing the one-time extra month against the loan term...");
    LoanTerms loan(10000.0, 5.0, 12, Date(1, QuantLib::March, 2025));
    BOOST_CHECK_NO_THROW(PaymentPlan(0.0, 1, PaymentPlan::OneTimeExtra(12, 100.0)).validate(loan));
    BOOST_CHECK_THROW(PaymentPlan(0.0, 1, PaymentPlan::OneTimeExtra(13, 100.0)).validate(loan), InvalidPlanError);
    // a monthly extra starting after the term is harmless
    BOOST_CHECK_NO_THROW(PaymentPlan(100.0, 24).validate(loan));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
