/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

BOOST_AUTO_TEST_SUITE(CLoggerTest)

namespace {
class CLoggerResetFixture {
public:
    ~CLoggerResetFixture() { rca::core::CLogger::instance().reset(); }
};

// Logs while this file's statics are initialised, which may be before those
// of the logger's own translation unit.
const std::string LEVEL_NAME_AT_STATIC_INIT{[] {
    LOG_DEBUG(<< "Logging during static initialisation");
    return rca::core::CLogger::levelToString(rca::core::CLogger::E_Info);
}()};
}

BOOST_AUTO_TEST_CASE(testLoggingDuringStaticInitialisation) {
    BOOST_REQUIRE_EQUAL("INFO", LEVEL_NAME_AT_STATIC_INIT);
    LOG_INFO(<< "Logger constructed in static initialisation is usable");
}

BOOST_FIXTURE_TEST_CASE(testSetLevel, CLoggerResetFixture) {
    rca::core::CLogger& logger{rca::core::CLogger::instance()};

    BOOST_REQUIRE_EQUAL(rca::core::CLogger::E_Debug, logger.loggingLevel());

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(rca::core::CLogger::E_Error));
    BOOST_REQUIRE_EQUAL(rca::core::CLogger::E_Error, logger.loggingLevel());

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(static_cast<rca::core::CLogger::ELevel>(42)) == false);
    BOOST_REQUIRE_EQUAL(rca::core::CLogger::E_Error, logger.loggingLevel());

    LOG_DEBUG(<< "This should not be seen");
    LOG_ERROR(<< "This should be seen");
}

BOOST_AUTO_TEST_CASE(testLevelNames) {
    BOOST_REQUIRE_EQUAL("TRACE", rca::core::CLogger::levelToString(rca::core::CLogger::E_Trace));
    BOOST_REQUIRE_EQUAL("WARN", rca::core::CLogger::levelToString(rca::core::CLogger::E_Warn));
    BOOST_REQUIRE_EQUAL("FATAL", rca::core::CLogger::levelToString(rca::core::CLogger::E_Fatal));

    std::istringstream strm{"ERROR"};
    rca::core::CLogger::ELevel level{rca::core::CLogger::E_Trace};
    strm >> level;
    BOOST_TEST_REQUIRE(strm.fail() == false);
    BOOST_REQUIRE_EQUAL(rca::core::CLogger::E_Error, level);

    std::istringstream bad{"LOUD"};
    bad >> level;
    BOOST_TEST_REQUIRE(bad.fail());
}

BOOST_FIXTURE_TEST_CASE(testReconfigure, CLoggerResetFixture) {
    rca::core::CLogger& logger{rca::core::CLogger::instance()};

    // No file means carry on logging to stderr
    BOOST_TEST_REQUIRE(logger.reconfigure(""));
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);

    BOOST_TEST_REQUIRE(logger.reconfigure("./no/such/file.properties") == false);
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);

    const std::string propertiesFile{"rcaLoggerTest.properties"};
    const std::string logFile{"rcaLoggerTest.log"};
    {
        std::ofstream strm{propertiesFile};
        strm << "[Core]\n"
                "Filter=\"%Severity% >= INFO\"\n"
                "[Sinks.Test]\n"
                "Destination=TextFile\n"
                "FileName=\""
             << logFile
             << "\"\n"
                "AutoFlush=true\n"
                "Format=\"%Severity% %Message%\"\n";
    }

    BOOST_TEST_REQUIRE(logger.reconfigure(propertiesFile));
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured());

    LOG_DEBUG(<< "filtered out");
    LOG_WARN(<< "written to file");

    // Resetting closes the file sink
    logger.reset();
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);

    std::ifstream strm{logFile};
    BOOST_TEST_REQUIRE(strm.is_open());
    std::string contents{std::istreambuf_iterator<char>{strm}, std::istreambuf_iterator<char>{}};
    BOOST_TEST_REQUIRE(contents.find("WARN written to file") != std::string::npos);
    BOOST_TEST_REQUIRE(contents.find("filtered out") == std::string::npos);
    strm.close();

    std::remove(propertiesFile.c_str());
    std::remove(logFile.c_str());
}

BOOST_FIXTURE_TEST_CASE(testFatalErrorHandler, CLoggerResetFixture) {
    std::string handled;
    {
        rca::core::CLogger::CScopeSetFatalErrorHandler scope{
            [&handled](std::string message) { handled = std::move(message); }};
        HANDLE_FATAL(<< "Input error: " << 42);
    }
    BOOST_REQUIRE_EQUAL("Input error: 42", handled);

    BOOST_REQUIRE_THROW(rca::core::CLogger::fatal(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
