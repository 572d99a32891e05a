/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CBoostTestJUnitOutput.h>

#include <boost/test/unit_test.hpp>

#include <cstdlib>

namespace rca {
namespace test {
namespace {
const std::string DEFAULT_OUTPUT_FILE{"junit_results.xml"};
const char* const OUTPUT_FILE_VARIABLE{"RCA_JUNIT_RESULTS"};
}

std::ofstream CBoostTestJUnitOutput::ms_JUnitOutputFile;

bool CBoostTestJUnitOutput::init() {
    std::string fileName{outputFileName()};
    if (fileName.empty()) {
        return true;
    }
    ms_JUnitOutputFile.open(fileName);
    if (ms_JUnitOutputFile.is_open() == false) {
        // Still run the tests with console output only
        return true;
    }
    boost::unit_test::unit_test_log.add_format(boost::unit_test::OF_JUNIT);
    boost::unit_test::unit_test_log.set_stream(boost::unit_test::OF_JUNIT, ms_JUnitOutputFile);
    return true;
}

std::string CBoostTestJUnitOutput::outputFileName() {
    const char* fileName{std::getenv(OUTPUT_FILE_VARIABLE)};
    return fileName != nullptr ? std::string{fileName} : DEFAULT_OUTPUT_FILE;
}
}
}
