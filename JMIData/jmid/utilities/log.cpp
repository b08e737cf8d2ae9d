/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <jmid/utilities/log.hpp>

#include <boost/algorithm/string/replace.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <iomanip>
#include <ql/errors.hpp>

using namespace boost::posix_time;
using namespace std;

namespace jmi {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";
const string FileLogger::name = "FileLogger";

// -- File Logger

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(ios::fixed, ios::floatfield);
    fout_.setf(ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << endl;
}

// -- Buffer Logger

void BufferLogger::log(unsigned level, const string& s) {
    if (level <= minLevel_)
        buffer_.push(s);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

// -- Log

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(ios::fixed, ios::floatfield);
    ls_.setf(ios::showpoint);
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

QuantLib::ext::shared_ptr<Logger> Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
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
    // 1. Timestamp
    ls_ << to_simple_string(microsec_clock::local_time()) << '\t';

    // 2. Level
    switch (m) {
    case JMI_ALERT:
        ls_ << "ALERT   ";
        break;
    case JMI_CRITICAL:
        ls_ << "CRITICAL";
        break;
    case JMI_ERROR:
        ls_ << "ERROR   ";
        break;
    case JMI_WARNING:
        ls_ << "WARNING ";
        break;
    case JMI_NOTICE:
        ls_ << "NOTICE  ";
        break;
    case JMI_DEBUG:
        ls_ << "DEBUG   ";
        break;
    case JMI_DATA:
        ls_ << "DATA    ";
        break;
    }

    // 3. source file:line, without the path
    string file = boost::filesystem::path(filename).filename().string();
    ls_ << '\t' << '[' << file << ':' << lineNo << ']' << '\t';
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    // clear the stream for the next message
    ls_.str(string());
    ls_.clear();
}

// -- Structured messages

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const map<string, string>& subFields)
    : category_(category), group_(group), message_(message), subFields_(subFields) {}

string StructuredMessage::json() const {
    ostringstream oss;
    oss << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\","
        << " \"message\":\"" << jsonify(message_) << "\"";
    if (!subFields_.empty()) {
        oss << ", \"sub_fields\": [ ";
        bool first = true;
        for (const auto& p : subFields_) {
            if (!first)
                oss << ", ";
            oss << "{ \"name\": \"" << p.first << "\", \"value\": \"" << jsonify(p.second) << "\" }";
            first = false;
        }
        oss << " ]";
    }
    oss << " }";
    return oss.str();
}

void StructuredMessage::log() const {
    if (category_ == Category::Error) {
        ALOG(name << " " << json());
    } else {
        WLOG(name << " " << json());
    }
}

ostream& operator<<(ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    default:
        return out << "UnknownType";
    }
}

ostream& operator<<(ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Analytics:
        return out << "Analytics";
    case StructuredMessage::Group::Model:
        return out << "Model";
    case StructuredMessage::Group::MarketData:
        return out << "Market Data";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Curve:
        return out << "Curve";
    default:
        return out << "UnknownType";
    }
}

string jsonify(const string& s) {
    string str = s;
    boost::replace_all(str, "\\", "\\\\");
    boost::replace_all(str, "\"", "\\\"");
    boost::replace_all(str, "\r", "\\r");
    boost::replace_all(str, "\n", "\\n");
    return str;
}

} // namespace data
} // namespace jmi
