/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Replay telemetry through the root cause analysis engine.
//!
//! DESCRIPTION:\n
//! Reads NDJSON records (metric samples, log entries, change events,
//! labels, reruns and ticks) and feeds them to the engine in order.
//! When the input is exhausted any debounced analysis runs are started,
//! the ranking model is optionally retrained, and the incidents with
//! their anomalies, suspects and the activity feed are written as JSON.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Input and output default to STDIN and STDOUT. Logging goes to STDERR
//! unless a Boost.Log settings file is supplied.
//!
#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CoreTypes.h>

#include <model/CRcaConfig.h>

#include <api/CEvaluator.h>
#include <api/CJsonOutputWriter.h>
#include <api/CNdJsonInputParser.h>
#include <api/CRcaEngine.h>
#include <api/CTelemetryRecordHandler.h>

#include "CCmdLineParser.h"

#include <boost/optional.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include <stdlib.h>

int main(int argc, char** argv) {
    // Read command line options
    std::string configFile;
    std::string logProperties;
    std::string inputFileName;
    std::string outputFileName;
    std::string modelFile;
    std::string saveModelFile;
    bool retrain(false);
    bool evaluate(false);
    if (rca::rcad::CCmdLineParser::parse(argc, argv, configFile, logProperties,
                                         inputFileName, outputFileName, modelFile,
                                         saveModelFile, retrain, evaluate) == false) {
        return EXIT_FAILURE;
    }

    if (rca::core::CLogger::instance().reconfigure(logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    LOG_DEBUG(<< rca::rcad::CCmdLineParser::VERSION);

    rca::model::CRcaConfig config;
    if (configFile.empty() == false && config.init(configFile) == false) {
        LOG_FATAL(<< "Engine config file '" << configFile << "' could not be loaded");
        return EXIT_FAILURE;
    }

    std::ifstream inputFile;
    if (inputFileName.empty() == false) {
        inputFile.open(inputFileName);
        if (inputFile.is_open() == false) {
            LOG_FATAL(<< "Unable to open input file '" << inputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::istream& input{inputFileName.empty() ? std::cin : inputFile};

    std::ofstream outputFile;
    if (outputFileName.empty() == false) {
        outputFile.open(outputFileName);
        if (outputFile.is_open() == false) {
            LOG_FATAL(<< "Unable to open output file '" << outputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::ostream& output{outputFileName.empty() ? std::cout : outputFile};

    // This object will do the work
    rca::api::CRcaEngine engine{config};

    if (modelFile.empty() == false) {
        std::ifstream strm{modelFile};
        if (strm.is_open() == false) {
            LOG_FATAL(<< "Unable to open ranking model file '" << modelFile << "'");
            return EXIT_FAILURE;
        }
        std::string json{std::istreambuf_iterator<char>{strm}, std::istreambuf_iterator<char>{}};
        if (engine.loadModel(json) == false) {
            LOG_FATAL(<< "Failed to load ranking model from '" << modelFile << "'");
            return EXIT_FAILURE;
        }
    }

    rca::api::CTelemetryRecordHandler handler{engine};
    rca::api::CNdJsonInputParser parser{input};
    if (parser.readStream([&handler](const rapidjson::Document& record) {
            return handler.handleRecord(record);
        }) == false) {
        LOG_FATAL(<< "Failed to handle input records");
        return EXIT_FAILURE;
    }
    LOG_INFO(<< "Handled " << handler.numberHandled() << " records, rejected "
             << handler.numberRejected() + parser.numberRecordsRejected());

    engine.flushPendingRuns();
    engine.waitForIdle();

    if (retrain) {
        rca::model::CRetrainer::SResult result{engine.retrain()};
        LOG_INFO(<< "Retraining on " << result.s_Labels << " labels: "
                 << rca::model::CRetrainer::print(result.s_Outcome));
    }

    boost::optional<rca::api::CEvaluator::SSummary> evaluation;
    if (evaluate) {
        evaluation = rca::api::CEvaluator::evaluate(engine);
    }

    rca::api::CJsonOutputWriter writer{output};
    writer.writeResults(engine, evaluation ? evaluation.get_ptr() : nullptr);

    if (saveModelFile.empty() == false) {
        std::ofstream strm{saveModelFile};
        if (strm.is_open() == false || engine.saveModel(strm) == false) {
            LOG_ERROR(<< "Failed to save ranking model to '" << saveModelFile << "'");
        }
    }

    LOG_INFO(<< rca::core::CProgramCounters::instance());

    // This message makes it easier to spot process crashes in a log file - if
    // this isn't present in the log for a given PID and there's no other log
    // message indicating early exit then the process has probably core dumped
    LOG_DEBUG(<< "rcad exiting");

    return EXIT_SUCCESS;
}
