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

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <ql/errors.hpp>

#include <iomanip>
#include <iostream>
#include <vector>

using namespace boost::filesystem;
using std::string;

namespace mpe {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";
const string FileLogger::name = "FileLogger";

void StderrLogger::log(unsigned l, const string& msg) {
    if (!alertOnly_ || l == MPE_ALERT)
        std::cerr << msg << std::endl;
}

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

void BufferLogger::log(unsigned level, const string& msg) {
    if (level <= minLevel_)
        buffer_.push(msg);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(name) != loggers_.end(), "No logger found with name " << name);
    return loggers_[name];
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Time stamp
    boost::posix_time::ptime now = boost::posix_time::microsec_clock::local_time();
    ls_ << now << " ";

    // 2. Level
    switch (m) {
    case MPE_ALERT:
        ls_ << "ALERT    ";
        break;
    case MPE_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case MPE_ERROR:
        ls_ << "ERROR    ";
        break;
    case MPE_WARNING:
        ls_ << "WARNING  ";
        break;
    case MPE_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case MPE_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case MPE_DATA:
        ls_ << "DATA     ";
        break;
    }

    // 3. source file:line, relative to the root path if one is set and truncated to maxLen_
    string filepath = rootPath_.empty() ? string(filename) : relative(path(filename), rootPath_).string();
    int lineNoLen = (int)std::to_string(lineNo).length();
    if ((int)filepath.length() + lineNoLen + 1 > maxLen_ && maxLen_ > lineNoLen + 4)
        filepath = "..." + filepath.substr(filepath.length() + lineNoLen + 4 - maxLen_);
    ls_ << std::left << std::setw(maxLen_ - lineNoLen - 1) << filepath << ':' << lineNo << " : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    // clear the stream
    ls_.str(string());
    ls_.clear();
}

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const std::map<string, string>& subFields)
    : category_(category), group_(group), message_(message), subFields_(subFields) {}

string StructuredMessage::json() const {
    std::ostringstream out;
    out << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonify(message_) << "\"";
    if (!subFields_.empty()) {
        std::vector<string> fields;
        for (const auto& f : subFields_)
            fields.push_back("\"" + jsonify(f.first) + "\":\"" + jsonify(f.second) + "\"");
        out << ", \"sub_fields\": { " << boost::algorithm::join(fields, ", ") << " }";
    }
    out << " }";
    return out.str();
}

void StructuredMessage::log() const {
    string msg = json();
    switch (category_) {
    case Category::Error:
        ALOG(name << " " << msg);
        break;
    case Category::Warning:
        WLOG(name << " " << msg);
        break;
    case Category::Unknown:
        LOG(name << " " << msg);
        break;
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    default:
        return out << "UnknownType";
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Loan:
        return out << "Loan";
    case StructuredMessage::Group::Plan:
        return out << "Payment Plan";
    case StructuredMessage::Group::Engine:
        return out << "Engine";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    default:
        return out << "UnknownType";
    }
}

string jsonify(const string& s) {
    string str = s;
    boost::replace_all(str, "\\", "\\\\"); // do this before the below otherwise we get \\"
    boost::replace_all(str, "\"", "\\\"");
    boost::replace_all(str, "\r", "\\r");
    boost::replace_all(str, "\n", "\\n");
    return str;
}

} // namespace data
} // namespace mpe
