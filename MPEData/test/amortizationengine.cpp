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
#include <mped/engine/amortizationengine.hpp>
#include <mped/loan/errors.hpp>
#include <mpet/toplevelfixture.hpp>

#include <ql/math/comparison.hpp>
#include <ql/math/randomnumbers/mt19937uniformrng.hpp>

#include <algorithm>
#include <cmath>

using namespace mpe::data;
using QuantLib::Date;
using QuantLib::MersenneTwisterUniformRng;
using QuantLib::Rounding;
using std::vector;

namespace {

Date start() { return Date(1, QuantLib::January, 2025); }

// Structural properties every schedule has
void checkScheduleShape(const LoanTerms& loan, const vector<MonthlyEntry>& schedule) {
    BOOST_REQUIRE(!schedule.empty());
    for (Size i = 0; i < schedule.size(); ++i) {
        const MonthlyEntry& e = schedule[i];
        BOOST_CHECK_EQUAL(e.monthIndex(), i + 1);
        BOOST_CHECK_EQUAL(e.calendarDate(), loan.paymentDate(i + 1));
        BOOST_CHECK(e.endingBalance() >= 0.0);
        BOOST_CHECK(e.scheduledPrincipal() >= 0.0);
        BOOST_CHECK(e.extraPrincipal() >= 0.0);
        BOOST_CHECK_SMALL(e.beginningBalance() - e.scheduledPrincipal() - e.extraPrincipal() - e.endingBalance(),
                          1e-8);
        BOOST_CHECK_SMALL(e.totalPayment() - e.scheduledPrincipal() - e.scheduledInterest() - e.extraPrincipal() -
                              e.escrowAddOns(),
                          1e-8);
        if (i > 0) {
            BOOST_CHECK_EQUAL(e.beginningBalance(), schedule[i - 1].endingBalance());
            BOOST_CHECK(schedule[i - 1].endingBalance() > 0.0);
        }
    }
    BOOST_CHECK_EQUAL(schedule.front().beginningBalance(), loan.principal());
    BOOST_CHECK_EQUAL(schedule.back().endingBalance(), 0.0);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(MPEDataTestSuite, mpe::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(AmortizationEngineTests)

BOOST_AUTO_TEST_CASE(testLevelPayment) {
    BOOST_TEST_MESSAGE("Testing the level payment...");

    BOOST_CHECK_SMALL(levelPayment(100000.0, 0.005, 360) - 599.5505, 1e-3);
    BOOST_CHECK_CLOSE(levelPayment(12000.0, 0.0, 12), 1000.0, 1e-12);
    BOOST_CHECK_CLOSE(levelPayment(1000.0, 0.01, 1), 1010.0, 1e-10);
    BOOST_CHECK_THROW(levelPayment(1000.0, 0.01, 0), QuantLib::Error);

    LoanTerms loan(100000.0, 6.0, 360, start());
    // rounded up to the cent by default
    BOOST_CHECK_CLOSE(AmortizationEngine().scheduledPayment(loan), 599.56, 1e-10);
    AmortizationConfig closest(PmiPolicy(), 2, Rounding::Closest);
    BOOST_CHECK_CLOSE(AmortizationEngine(closest).scheduledPayment(loan), 599.55, 1e-10);

    // an exact cent amount is not rounded up
    BOOST_CHECK_CLOSE(AmortizationEngine().scheduledPayment(LoanTerms(12000.0, 0.0, 12, start())), 1000.0, 1e-12);

    // the schedule amortizes with the payment at accrual precision
    BOOST_CHECK_CLOSE(AmortizationEngine().amortizingPayment(loan), 599.550525, 1e-10);
    AmortizationConfig fourDecimals(PmiPolicy(), 2, Rounding::Up, 1200, 4);
    BOOST_CHECK_CLOSE(AmortizationEngine(fourDecimals).amortizingPayment(loan), 599.5505, 1e-10);
}

BOOST_AUTO_TEST_CASE(testFullPayoffZeroRate) {
    BOOST_TEST_MESSAGE("Testing a zero rate loan paid off over twelve months...");

    LoanTerms loan(12000.0, 0.0, 12, start());
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan);

    BOOST_REQUIRE_EQUAL(schedule.size(), 12);
    checkScheduleShape(loan, schedule);
    for (const auto& e : schedule) {
        BOOST_CHECK_CLOSE(e.scheduledPrincipal(), 1000.0, 1e-12);
        BOOST_CHECK_EQUAL(e.scheduledInterest(), 0.0);
        BOOST_CHECK_EQUAL(e.extraPrincipal(), 0.0);
        BOOST_CHECK(!e.pmiActive());
    }
    BOOST_CHECK_EQUAL(schedule.back().endingBalance(), 0.0);
    BOOST_CHECK_EQUAL(schedule.back().calendarDate(), Date(1, QuantLib::December, 2025));
}

BOOST_AUTO_TEST_CASE(testZeroRateStraightLine) {
    BOOST_TEST_MESSAGE("Testing straight line principal reduction of a zero rate loan...");

    LoanTerms loan(10000.0, 0.0, 7, start());
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan);

    BOOST_REQUIRE_EQUAL(schedule.size(), 7);
    checkScheduleShape(loan, schedule);
    Real total = 0.0;
    for (Size i = 0; i < schedule.size(); ++i) {
        BOOST_CHECK_EQUAL(schedule[i].scheduledInterest(), 0.0);
        BOOST_CHECK_SMALL(schedule[i].scheduledPrincipal() - 10000.0 / 7.0, 1e-5);
        total += schedule[i].scheduledPrincipal();
    }
    // the last period takes the remainder
    BOOST_CHECK_CLOSE(schedule.back().scheduledPrincipal(), 1428.571426, 1e-10);
    BOOST_CHECK_SMALL(total - 10000.0, 1e-8);
}

BOOST_AUTO_TEST_CASE(testPrincipalIsRepaid) {
    BOOST_TEST_MESSAGE("Testing that the scheduled principal sums to the loan amount...");

    struct Case {
        Real principal, rate;
        Size term;
    };
    vector<Case> cases = {{100000.0, 6.0, 360},  {180000.0, 6.5, 360}, {250000.0, 3.125, 180},
                          {5000.0, 11.99, 24},    {1234.56, 0.5, 7},     {750000.0, 7.25, 480},
                          {99999.99, 4.875, 120}, {300.0, 18.0, 3}};

    AmortizationEngine engine;
    for (const auto& c : cases) {
        LoanTerms loan(c.principal, c.rate, c.term, start());
        vector<MonthlyEntry> schedule = engine.computeSchedule(loan);
        checkScheduleShape(loan, schedule);

        Real principal = 0.0;
        for (const auto& e : schedule)
            principal += e.scheduledPrincipal();
        BOOST_CHECK_SMALL(principal - c.principal, 0.01);
        BOOST_CHECK(schedule.size() == c.term || schedule.size() + 1 == c.term);
    }
}

BOOST_AUTO_TEST_CASE(testScheduleLengthMatchesTerm) {
    BOOST_TEST_MESSAGE("Testing schedule length and repaid principal for random loans...");

    struct Case {
        Real principal, rate;
        Size term;
    };
    // small loans with long terms, a cent on the payment is a large share of it
    vector<Case> cases = {{100.0, 0.0, 360}, {100.0, 3.0, 360}, {500.0, 5.0, 480}, {100.0, 0.06, 480}};

    MersenneTwisterUniformRng rng(7);
    for (Size n = 0; n < 400; ++n) {
        Real principal = std::floor(100.0 * std::pow(10.0, 4.0 * rng.nextReal()) * 100.0) / 100.0;
        Real rate = rng.nextReal() < 0.1 ? 0.0 : std::floor(12000.0 * rng.nextReal()) / 1000.0;
        Size term = std::min<Size>(480, 1 + static_cast<Size>(480.0 * rng.nextReal()));
        cases.push_back({std::max(principal, 100.0), rate, term});
    }

    AmortizationEngine engine;
    for (const auto& c : cases) {
        BOOST_TEST_CONTEXT("loan " << c.principal << " at " << c.rate << "% over " << c.term << " months") {
            LoanTerms loan(c.principal, c.rate, c.term, start());
            vector<MonthlyEntry> schedule = engine.computeSchedule(loan);
            BOOST_CHECK(schedule.size() == c.term || schedule.size() + 1 == c.term);
            BOOST_CHECK_EQUAL(schedule.back().endingBalance(), 0.0);

            Real principal = 0.0;
            for (const auto& e : schedule) {
                principal += e.scheduledPrincipal();
                if (c.rate == 0.0 && e.monthIndex() < schedule.size())
                    BOOST_CHECK_SMALL(e.scheduledPrincipal() - c.principal / c.term, 1e-6);
            }
            BOOST_CHECK_SMALL(principal - c.principal, 0.01);
        }
    }
}

BOOST_AUTO_TEST_CASE(testInterestRoundedAtAccrual) {
    BOOST_TEST_MESSAGE("Testing interest rounding at accrual precision...");

    LoanTerms loan(1000.0, 7.0, 12, start());
    BOOST_CHECK_CLOSE(AmortizationEngine().computeSchedule(loan).front().scheduledInterest(), 5.833333, 1e-10);
    AmortizationConfig fourDecimals(PmiPolicy(), 2, Rounding::Up, 1200, 4);
    BOOST_CHECK_CLOSE(AmortizationEngine(fourDecimals).computeSchedule(loan).front().scheduledInterest(), 5.8333,
                      1e-10);
    AmortizationConfig cents(PmiPolicy(), 2, Rounding::Up, 1200, 2);
    BOOST_CHECK_CLOSE(AmortizationEngine(cents).computeSchedule(loan).front().scheduledInterest(), 5.83, 1e-10);

    BOOST_CHECK_THROW(AmortizationConfig(PmiPolicy(), 1), QuantLib::Error);
    BOOST_CHECK_THROW(AmortizationConfig(PmiPolicy(), 7), QuantLib::Error);
    BOOST_CHECK_THROW(AmortizationConfig(PmiPolicy(), 4, Rounding::Up, 1200, 3), QuantLib::Error);
    BOOST_CHECK_THROW(AmortizationConfig(PmiPolicy(), 2, Rounding::Up, 1200, 11), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testSinglePeriodLoan) {
    BOOST_TEST_MESSAGE("Testing a loan with a one month term...");

    LoanTerms loan(1000.0, 12.0, 1, start());
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan);

    BOOST_REQUIRE_EQUAL(schedule.size(), 1);
    checkScheduleShape(loan, schedule);
    BOOST_CHECK_CLOSE(schedule[0].scheduledInterest(), 10.0, 1e-10);
    BOOST_CHECK_CLOSE(schedule[0].scheduledPrincipal(), 1000.0, 1e-12);
    BOOST_CHECK_CLOSE(schedule[0].totalPayment(), 1010.0, 1e-10);

    // an extra payment has nothing left to pay
    schedule = AmortizationEngine().computeSchedule(loan, PaymentPlan(500.0));
    BOOST_REQUIRE_EQUAL(schedule.size(), 1);
    BOOST_CHECK_EQUAL(schedule[0].extraPrincipal(), 0.0);
    BOOST_CHECK_EQUAL(schedule[0].endingBalance(), 0.0);
}

BOOST_AUTO_TEST_CASE(testOneTimeExtraPaysOffInFirstPeriod) {
    BOOST_TEST_MESSAGE("Testing a one-time extra payment that retires the loan in the first period...");

    LoanTerms loan(5000.0, 5.0, 12, start());
    PaymentPlan plan(0.0, 1, PaymentPlan::OneTimeExtra(1, 5000.0));
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan, plan);

    BOOST_REQUIRE_EQUAL(schedule.size(), 1);
    checkScheduleShape(loan, schedule);
    BOOST_CHECK_CLOSE(schedule[0].scheduledInterest(), 20.833333, 1e-10);
    // clipped to what the scheduled principal leaves
    BOOST_CHECK(schedule[0].extraPrincipal() < 5000.0);
    BOOST_CHECK_CLOSE(schedule[0].principalPaid(), 5000.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(testExtraPaymentClipping) {
    BOOST_TEST_MESSAGE("Testing that extra payments are clipped to the remaining balance...");

    LoanTerms loan(1000.0, 0.0, 10, start());
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan, PaymentPlan(600.0));

    BOOST_REQUIRE_EQUAL(schedule.size(), 2);
    checkScheduleShape(loan, schedule);
    BOOST_CHECK_CLOSE(schedule[0].extraPrincipal(), 600.0, 1e-12);
    BOOST_CHECK_CLOSE(schedule[0].endingBalance(), 300.0, 1e-12);
    BOOST_CHECK_CLOSE(schedule[1].scheduledPrincipal(), 100.0, 1e-12);
    BOOST_CHECK_CLOSE(schedule[1].extraPrincipal(), 200.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(testExtraEffectiveFromMonth) {
    BOOST_TEST_MESSAGE("Testing extra monthly payments starting in a later month...");

    LoanTerms loan(100000.0, 6.0, 360, start());
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan, PaymentPlan(100.0, 3));
    checkScheduleShape(loan, schedule);
    BOOST_CHECK_EQUAL(schedule[0].extraPrincipal(), 0.0);
    BOOST_CHECK_EQUAL(schedule[1].extraPrincipal(), 0.0);
    BOOST_CHECK_CLOSE(schedule[2].extraPrincipal(), 100.0, 1e-12);
    BOOST_CHECK(schedule.size() < 360);
}

BOOST_AUTO_TEST_CASE(testEscrowAddOns) {
    BOOST_TEST_MESSAGE("Testing escrow add-on costs...");

    LoanTerms loan(12000.0, 0.0, 12, start(), boost::none, AddOnCosts(250.0, 100.0, 50.0));
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan);
    BOOST_REQUIRE_EQUAL(schedule.size(), 12);
    for (const auto& e : schedule) {
        BOOST_CHECK_CLOSE(e.escrowAddOns(), 400.0, 1e-12);
        BOOST_CHECK_CLOSE(e.totalPayment(), 1400.0, 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(testEndOfMonthDates) {
    BOOST_TEST_MESSAGE("Testing schedule dates of a loan starting at month end...");

    LoanTerms loan(3000.0, 0.0, 3, Date(31, QuantLib::January, 2025));
    vector<MonthlyEntry> schedule = AmortizationEngine().computeSchedule(loan);
    BOOST_REQUIRE_EQUAL(schedule.size(), 3);
    BOOST_CHECK_EQUAL(schedule[1].calendarDate(), Date(28, QuantLib::February, 2025));
    BOOST_CHECK_EQUAL(schedule[2].calendarDate(), Date(31, QuantLib::March, 2025));
}

BOOST_AUTO_TEST_CASE(testReferentialTransparency) {
    BOOST_TEST_MESSAGE("Testing that identical inputs give identical schedules...");

    LoanTerms loan(180000.0, 6.5, 360, start(), 200000.0, AddOnCosts(250.0, 100.0, 0.0, 75.0));
    PaymentPlan plan(150.0, 6, PaymentPlan::OneTimeExtra(24, 7500.0));
    AmortizationEngine engine;
    vector<MonthlyEntry> first = engine.computeSchedule(loan, plan);
    vector<MonthlyEntry> second = engine.computeSchedule(loan, plan);
    vector<MonthlyEntry> third = AmortizationEngine().computeSchedule(loan, plan);
    BOOST_CHECK(first == second);
    BOOST_CHECK(first == third);
}

BOOST_AUTO_TEST_CASE(testFixedPayment) {
    BOOST_TEST_MESSAGE("Testing a loan with a fixed monthly payment...");

    LoanTerms loan(12000.0, 0.0, 12, start(), boost::none, AddOnCosts(), 1500.0);
    AmortizationEngine engine;
    BOOST_CHECK_EQUAL(engine.scheduledPayment(loan), 1500.0);
    vector<MonthlyEntry> schedule = engine.computeSchedule(loan);
    BOOST_REQUIRE_EQUAL(schedule.size(), 8);
    checkScheduleShape(loan, schedule);
    for (const auto& e : schedule)
        BOOST_CHECK_CLOSE(e.scheduledPrincipal(), 1500.0, 1e-12);

    // a payment below the level payment runs past the term
    LoanTerms slow(100000.0, 6.0, 360, start(), boost::none, AddOnCosts(), 550.0);
    schedule = engine.computeSchedule(slow);
    checkScheduleShape(slow, schedule);
    BOOST_CHECK(schedule.size() > 360);
    BOOST_CHECK(schedule.size() <= 1200);
}

BOOST_AUTO_TEST_CASE(testFixedPaymentBeyondHorizon) {
    BOOST_TEST_MESSAGE("Testing fixed payments that do not pay off within the horizon...");

    // barely covers the interest, takes 1247 months to pay off
    LoanTerms loan(100000.0, 6.0, 360, start(), boost::none, AddOnCosts(), 501.0);
    BOOST_CHECK_THROW(AmortizationEngine().computeSchedule(loan), InvalidLoanError);
    AmortizationConfig longHorizon(PmiPolicy(), 2, Rounding::Up, 1500);
    vector<MonthlyEntry> schedule;
    BOOST_CHECK_NO_THROW(schedule = AmortizationEngine(longHorizon).computeSchedule(loan));
    BOOST_CHECK_EQUAL(schedule.size(), 1247);
    checkScheduleShape(loan, schedule);
    AmortizationConfig exactHorizon(PmiPolicy(), 2, Rounding::Up, 1247);
    BOOST_CHECK_NO_THROW(AmortizationEngine(exactHorizon).computeSchedule(loan));
    AmortizationConfig shortHorizon(PmiPolicy(), 2, Rounding::Up, 1246);
    BOOST_CHECK_THROW(AmortizationEngine(shortHorizon).computeSchedule(loan), InvalidLoanError);

    // valid loans whose payment is too small to retire them
    LoanTerms tiny(10000.0, 0.0, 12, start(), boost::none, AddOnCosts(), 0.004);
    BOOST_CHECK_THROW(AmortizationEngine().computeSchedule(tiny), InvalidLoanError);
    LoanTerms zero(10000.0, 0.0, 12, start(), boost::none, AddOnCosts(), 1e-7);
    BOOST_CHECK_THROW(AmortizationEngine().computeSchedule(zero), InvalidLoanError);
}

BOOST_AUTO_TEST_CASE(testHorizonGuard) {
    BOOST_TEST_MESSAGE("Testing the horizon guard on the loan term...");

    AmortizationConfig shortHorizon(PmiPolicy(), 2, Rounding::Up, 360);
    BOOST_CHECK_THROW(AmortizationEngine(shortHorizon).computeSchedule(LoanTerms(100000.0, 6.0, 480, start())),
                      InvariantViolation);
    BOOST_CHECK_THROW(AmortizationConfig(PmiPolicy(), 2, Rounding::Up, 0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testInvalidPlanForLoan) {
    BOOST_TEST_MESSAGE("Testing a one-time extra payment outside the loan term...");

    LoanTerms loan(10000.0, 5.0, 12, start());
    BOOST_CHECK_THROW(AmortizationEngine().computeSchedule(loan, PaymentPlan(0.0, 1, PaymentPlan::OneTimeExtra(13, 1.0))),
                      InvalidPlanError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
