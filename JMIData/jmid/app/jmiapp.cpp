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

#include <jmid/app/jmiapp.hpp>
#include <jmid/app/structuredevaluationerror.hpp>
#include <jmid/marketdata/csvloader.hpp>
#include <jmid/report/csvreport.hpp>
#include <jmid/report/metricsreportwriter.hpp>
#include <jmid/utilities/parsers.hpp>
#include <jmid/utilities/to_string.hpp>
#include <jmid/version.hpp>

#include <boost/chrono.hpp>
#include <boost/filesystem.hpp>

#include <iostream>
#include <mutex>

using boost::timer::default_places;
using std::string;

#define CONSOLE(text)                                                                                                  \
    if (console_)                                                                                                      \
        std::cout << text << std::endl;

namespace jmi {
namespace data {

JMIApp::JMIApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console)
    : params_(params), console_(console), logMask_(15) {
    QL_REQUIRE(params_, "JMIApp: no parameters given");
}

JMIApp::~JMIApp() {
    // Close logs
    closeLog();
}

Real JMIApp::getRunTime() {
    boost::chrono::duration<double> seconds = boost::chrono::nanoseconds(runTimer_.elapsed().wall);
    return seconds.count();
}

string JMIApp::version() { return string(JMI_VERSION); }

void JMIApp::initFromParams() {
    inputPath_ = params_->get("setup", "inputPath", false);
    if (inputPath_.empty())
        inputPath_ = ".";
    outputPath_ = params_->get("setup", "outputPath", false);
    if (outputPath_.empty())
        outputPath_ = ".";

    string tmp = params_->get("setup", "asOfDate", false);
    asof_ = tmp.empty() ? Date() : parseDate(tmp);

    // Logging group overrides the setup values
    logFile_ = params_->get("setup", "logFile", false);
    tmp = params_->get("setup", "logMask", false);
    logMask_ = tmp.empty() ? 15 : static_cast<Size>(parseInteger(tmp));
    if (params_->hasGroup("logging")) {
        tmp = params_->get("logging", "logFile", false);
        if (!tmp.empty())
            logFile_ = tmp;
        tmp = params_->get("logging", "logMask", false);
        if (!tmp.empty())
            logMask_ = static_cast<Size>(parseInteger(tmp));
    }
    if (logFile_.empty())
        logFile_ = "log.txt";
    setupLog(outputPath_, outputPath_ + "/" + logFile_, logMask_);

    params_->log();

    if (!aggregator_) {
        EngineConfig config;
        string configFile = params_->get("setup", "configFile", false);
        if (!configFile.empty()) {
            CONSOLE("Loading engine configuration from " << configFile);
            config.fromFile(inputPath_ + "/" + configFile);
        } else {
            WLOG("No configFile given, using the default engine configuration");
        }
        aggregator_ = QuantLib::ext::make_shared<MetricsAggregator>(
            config, QuantLib::ext::make_shared<InMemorySnapshotStore>());
    }
    LOG("initFromParams done, as of " << (asof_ == Date() ? string("file date") : to_string(asof_)));
}

RawMarketData JMIApp::loadMarketData() const {
    string oisFile = inputPath_ + "/" + params_->get("setup", "oisFile");
    string bondFile = inputPath_ + "/" + params_->get("setup", "bondFile");
    CONSOLE("Loading market data from " << oisFile << " and " << bondFile);
    QL_REQUIRE(aggregator_, "JMIApp: initFromParams must be called before loading market data");
    CSVLoader loader(oisFile, bondFile, asof_, aggregator_->config().marketDataConfig().bondFileEncoding());
    RawMarketData raw = loader.data();
    string dataVersion = params_->get("setup", "dataVersion", false);
    if (!dataVersion.empty())
        raw.dataVersion = dataVersion;
    return raw;
}

void JMIApp::writeReports(const MetricsSnapshot& snapshot) const {
    string rateFile = params_->get("output", "rateProbabilitiesFile", false);
    string creditFile = params_->get("output", "creditProfilesFile", false);
    string jsonFile = params_->get("output", "snapshotFile", false);
    string curvesFile = params_->get("output", "curvesFile", false);
    string tmp = params_->get("output", "utf8Bom", false);
    bool utf8Bom = tmp.empty() ? false : parseBool(tmp);

    MetricsReportWriter writer;
    CSVFileReport rateReport(outputPath_ + "/" + (rateFile.empty() ? "rate_probabilities.csv" : rateFile));
    writer.writeRateProbabilities(rateReport, snapshot);
    CSVFileReport creditReport(outputPath_ + "/" + (creditFile.empty() ? "credit_profiles.csv" : creditFile), ',',
                               true, '\0', "#N/A", false, utf8Bom);
    writer.writeCreditProfiles(creditReport, snapshot);
    CSVFileReport curvesReport(outputPath_ + "/" + (curvesFile.empty() ? "curves.csv" : curvesFile));
    writer.writeCurves(curvesReport, snapshot);
    writer.writeJson(outputPath_ + "/" + (jsonFile.empty() ? "snapshot.json" : jsonFile), snapshot);
    LOG("Reports written to " << outputPath_);
}

bool JMIApp::run() {

    // Only one thread at a time should call run
    static std::mutex _s_mutex;
    std::lock_guard<std::mutex> lock(_s_mutex);

    runTimer_.start();

    try {
        initFromParams();
        RawMarketData raw = loadMarketData();
        CONSOLE("Evaluating metrics for " << raw.dataVersion);
        auto snapshot = aggregator_->evaluate(raw);
        writeReports(*snapshot);
    } catch (std::exception& e) {
        runTimer_.stop();
        StructuredEvaluationErrorMessage("JMIApp::run()", "Error", e.what()).log();
        CONSOLE("Error: " << e.what());
        return false;
    }

    runTimer_.stop();

    CONSOLE("run time: " << runTimer_.format(default_places, "%w") << " sec");
    CONSOLE("JMI done.");
    LOG("JMI done.");
    return true;
}

void JMIApp::setupLog(const std::string& path, const std::string& file, Size mask) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    Log::instance().setMask(static_cast<unsigned>(mask));
    Log::instance().switchOn();
}

void JMIApp::closeLog() { Log::instance().removeAllLoggers(); }

} // namespace data
} // namespace jmi
