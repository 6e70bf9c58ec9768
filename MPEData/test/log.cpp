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

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <mped/utilities/log.hpp>
#include <mpet/toplevelfixture.hpp>

#include <fstream>
#include <string>
#include <vector>

using namespace mpe::data;
using std::string;
using std::vector;

namespace {

QuantLib::ext::shared_ptr<BufferLogger> bufferLogger(unsigned mask, unsigned minLevel = MPE_DATA) {
    auto logger = QuantLib::ext::make_shared<BufferLogger>(minLevel);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(mask);
    Log::instance().switchOn();
    return logger;
}

vector<string> drain(BufferLogger& logger) {
    vector<string> messages;
    while (logger.hasNext())
        messages.push_back(logger.next());
    return messages;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(MPEDataTestSuite, mpe::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LogTests)

BOOST_AUTO_TEST_CASE(testLogMask) {
    BOOST_TEST_MESSAGE("Testing log level filtering...");

    auto logger = bufferLogger(MPE_ALERT | MPE_WARNING);
    ALOG("alert message");
    ELOG("error message");
    WLOG("warning message");
    LOG("notice message");
    DLOG("debug message");

    vector<string> messages = drain(*logger);
    BOOST_REQUIRE_EQUAL(messages.size(), 2);
    BOOST_CHECK(messages[0].find("ALERT") != string::npos);
    BOOST_CHECK(messages[0].find("alert message") != string::npos);
    BOOST_CHECK(messages[1].find("WARNING") != string::npos);
    BOOST_CHECK(messages[1].find("warning message") != string::npos);
    BOOST_CHECK_THROW(logger->next(), QuantLib::Error);

    Log::instance().switchOff();
    ALOG("not logged");
    BOOST_CHECK(!logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testBufferLoggerMinLevel) {
    BOOST_TEST_MESSAGE("Testing the buffer logger level...");

    auto logger = bufferLogger(255, MPE_ERROR);
    ALOG("alert");
    WLOG("warning");
    TLOG("data");
    BOOST_CHECK_EQUAL(drain(*logger).size(), 1);
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {
    BOOST_TEST_MESSAGE("Testing logger registration...");

    bufferLogger(255);
    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>()), QuantLib::Error);
    BOOST_CHECK_NO_THROW(Log::instance().logger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().logger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().removeLogger("NoSuchLogger"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testFileLogger) {
    BOOST_TEST_MESSAGE("Testing the file logger...");

    boost::filesystem::path file = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
    {
        auto logger = QuantLib::ext::make_shared<FileLogger>(file.string());
        Log::instance().registerLogger(logger);
        Log::instance().setMask(255);
        Log::instance().switchOn();
        LOG("written to file");
        Log::instance().removeLogger(FileLogger::name);
    }
    std::ifstream in(file.string());
    string line;
    BOOST_REQUIRE(std::getline(in, line));
    BOOST_CHECK(line.find("NOTICE") != string::npos);
    BOOST_CHECK(line.find("written to file") != string::npos);
    in.close();
    boost::filesystem::remove(file);

    BOOST_CHECK_THROW(FileLogger("/no/such/directory/mpe.log"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testStructuredMessage) {
    BOOST_TEST_MESSAGE("Testing structured messages...");

    StructuredMessage warning(StructuredMessage::Category::Warning, StructuredMessage::Group::Loan,
                              "PMI \"removal\" skipped", {{"reason", "no home value"}});
    BOOST_CHECK_EQUAL(warning.json(), "{ \"category\":\"Warning\", \"group\":\"Loan\", \"message\":\"PMI "
                                      "\\\"removal\\\" skipped\", \"sub_fields\": { \"reason\":\"no home value\" } }");

    StructuredMessage error(StructuredMessage::Category::Error, StructuredMessage::Group::Configuration, "bad file");
    BOOST_CHECK_EQUAL(error.json(), "{ \"category\":\"Error\", \"group\":\"Configuration\", \"message\":\"bad file\" }");

    auto logger = bufferLogger(255);
    warning.log();
    error.log();
    vector<string> messages = drain(*logger);
    BOOST_REQUIRE_EQUAL(messages.size(), 2);
    BOOST_CHECK(messages[0].find("WARNING") != string::npos);
    BOOST_CHECK(messages[0].find(string(StructuredMessage::name) + " " + warning.json()) != string::npos);
    BOOST_CHECK(messages[1].find("ALERT") != string::npos);

    BOOST_CHECK_EQUAL(jsonify("a\\b\n\"c\""), "a\\\\b\\n\\\"c\\\"");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
