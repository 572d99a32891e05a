/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/from_stream.hpp>

#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace {
const char* const SEVERITY_ATTRIBUTE_NAME{"Severity"};
const char* const TIMESTAMP_ATTRIBUTE_NAME{"TimeStamp"};

using TStrArray = std::array<std::string, 6>;

//! Level names are function statics so they are usable while other
//! translation units are statically initialised.
const TStrArray& levelNames() {
    static const TStrArray names{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    return names;
}

const std::string& unknownLevelName() {
    static const std::string name{"UNKNOWN"};
    return name;
}

//! Strip the directory from a source file name.
const char* baseName(const char* file) {
    const char* result{file};
    for (const char* c = file; *c != '\0'; ++c) {
        if (*c == '/' || *c == '\\') {
            result = c + 1;
        }
    }
    return result;
}

//! Writes records in the layout
//! "<timestamp> [<pid>] <level> <file>@<line> <message>".
class CDefaultFormatter {
public:
    CDefaultFormatter(boost::log::attribute_name fileAttributeName,
                      boost::log::attribute_name lineAttributeName)
        : m_FileAttributeName{fileAttributeName},
          m_LineAttributeName{lineAttributeName}, m_Pid{::getpid()} {}

    void operator()(const boost::log::record_view& record,
                    boost::log::formatting_ostream& strm) const {
        auto timestamp = boost::log::extract<boost::posix_time::ptime>(
            TIMESTAMP_ATTRIBUTE_NAME, record);
        if (timestamp) {
            strm << boost::posix_time::to_iso_extended_string(timestamp.get()) << ' ';
        }
        strm << '[' << m_Pid << "] ";
        auto level = boost::log::extract<rca::core::CLogger::ELevel>(
            SEVERITY_ATTRIBUTE_NAME, record);
        if (level) {
            strm << rca::core::CLogger::levelToString(level.get()) << ' ';
        }
        auto file = boost::log::extract<const char*>(m_FileAttributeName, record);
        auto line = boost::log::extract<int>(m_LineAttributeName, record);
        if (file && line) {
            strm << baseName(file.get()) << '@' << line.get() << ' ';
        }
        strm << record[boost::log::expressions::smessage];
    }

private:
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    pid_t m_Pid;
};

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.  This must follow the constants the constructor uses.
const rca::core::CLogger& DO_NOT_USE_THIS_VARIABLE = rca::core::CLogger::instance();
}

namespace rca {
namespace core {

CLogger::CLogger()
    : m_Level{E_Debug}, m_Reconfigured{false}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    m_Reconfigured = false;
    m_Level = E_Debug;

    // When the logger first starts up, log everything at debug and above to
    // stderr.  Having this hardcoded configuration means that the unit tests
    // and other utility programs just work with minimal effort.  Longer
    // running processes are expected to reconfigure the logging using a real
    // settings file.
    auto core = boost::log::core::get();
    core->remove_all_sinks();
    core->reset_filter();

    auto sink = boost::log::add_console_log(std::cerr);
    sink->set_formatter(CDefaultFormatter{m_FileAttributeName, m_LineAttributeName});
    sink->locked_backend()->auto_flush(true);

    core->set_filter([this](const boost::log::attribute_value_set& attributes) {
        auto level = boost::log::extract<ELevel>(SEVERITY_ATTRIBUTE_NAME, attributes);
        return level && static_cast<int>(level.get()) >= m_Level.load();
    });
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("Rca Fatal Exception");
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = static_cast<int>(level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return static_cast<ELevel>(m_Level.load());
}

const std::string& CLogger::levelToString(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return unknownLevelName();
    }
    return levelNames()[static_cast<std::size_t>(level)];
}

bool CLogger::reconfigure(const std::string& propertiesFile) {
    if (propertiesFile.empty()) {
        // Empty is OK - it just means we keep logging to stderr
        return true;
    }
    return this->reconfigureFromFile(propertiesFile);
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open properties file " << propertiesFile
                  << " for logger re-initialisation");
        return false;
    }

    if (this->reconfigureFromSettings(strm) == false) {
        return false;
    }

    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);

    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    auto core = boost::log::core::get();
    try {
        core->remove_all_sinks();
        core->reset_filter();
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        // The settings were bad, so put back the default configuration
        // before reporting the problem
        this->reset();
        LOG_ERROR(<< "Failed to reinitialise logger: " << e.what());
        return false;
    }

    m_Reconfigured = true;

    return true;
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    std::cerr << message << std::endl;
    std::exit(EXIT_FAILURE);
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    strm >> name;
    for (std::size_t i = 0; i < levelNames().size(); ++i) {
        if (name == levelNames()[i]) {
            level = static_cast<CLogger::ELevel>(i);
            return strm;
        }
    }
    strm.setstate(std::ios_base::failbit);
    return strm;
}
}
}
