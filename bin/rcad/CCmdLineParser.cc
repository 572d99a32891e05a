/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace rca {
namespace rcad {

const std::string CCmdLineParser::VERSION = "rcad 1.0.0";

const std::string CCmdLineParser::DESCRIPTION = "Usage: rcad [options]\n"
                                                "Options:";

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& configFile,
                           std::string& logProperties,
                           std::string& inputFileName,
                           std::string& outputFileName,
                           std::string& modelFile,
                           std::string& saveModelFile,
                           bool& retrain,
                           bool& evaluate) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("version", "Display version information and exit")
            ("config", boost::program_options::value<std::string>(),
                        "Optional engine config file")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional logger properties file")
            ("input", boost::program_options::value<std::string>(),
                        "Optional file to read NDJSON records from - not present means read from STDIN")
            ("output", boost::program_options::value<std::string>(),
                        "Optional file to write results to - not present means write to STDOUT")
            ("model", boost::program_options::value<std::string>(),
                        "Optional ranking model file to activate before replay")
            ("saveModel", boost::program_options::value<std::string>(),
                        "Optional file to write the active ranking model to on exit")
            ("retrain",
                        "Retrain the ranking model on the recorded labels after replay")
            ("evaluate",
                        "Include precision and reciprocal rank over labelled incidents in the output")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc),
                                      vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("version") > 0) {
            std::cerr << VERSION << std::endl;
            return false;
        }
        if (vm.count("config") > 0) {
            configFile = vm["config"].as<std::string>();
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("input") > 0) {
            inputFileName = vm["input"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            outputFileName = vm["output"].as<std::string>();
        }
        if (vm.count("model") > 0) {
            modelFile = vm["model"].as<std::string>();
        }
        if (vm.count("saveModel") > 0) {
            saveModelFile = vm["saveModel"].as<std::string>();
        }
        if (vm.count("retrain") > 0) {
            retrain = true;
        }
        if (vm.count("evaluate") > 0) {
            evaluate = true;
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
