/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <unistd.h>

namespace {
// These must be defined before DO_NOT_USE_THIS_VARIABLE because the logger
// constructor uses them during static initialisation.
const std::string SEVERITY_ATTRIBUTE{"Severity"};
const std::string TIME_STAMP_ATTRIBUTE{"TimeStamp"};

//! Write a record as "<ISO timestamp> [<pid>] <LEVEL> <file>@<line> <message>".
void formatRecord(const boost::log::record_view& record,
                  boost::log::formatting_ostream& strm) {
    const greenweb::core::CLogger& logger{greenweb::core::CLogger::instance()};

    auto timeStamp = boost::log::extract<boost::posix_time::ptime>(
        TIME_STAMP_ATTRIBUTE, record);
    if (timeStamp) {
        strm << boost::posix_time::to_iso_extended_string(timeStamp.get()) << ' ';
    }
    strm << '[' << ::getpid() << "] ";

    auto level = boost::log::extract<greenweb::core::CLogger::ELevel>(
        SEVERITY_ATTRIBUTE, record);
    if (level) {
        strm << greenweb::core::CLogger::levelToString(level.get()) << ' ';
    }

    auto file = boost::log::extract<std::string>(logger.fileAttributeName(), record);
    auto line = boost::log::extract<int>(logger.lineAttributeName(), record);
    if (file && line) {
        // Only the base name of the file is interesting
        const std::string& path{file.get()};
        std::size_t slash{path.find_last_of("/\\")};
        strm << (slash == std::string::npos ? path : path.substr(slash + 1))
             << '@' << line.get() << ' ';
    }

    strm << record[boost::log::expressions::smessage];
}

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.
const greenweb::core::CLogger& DO_NOT_USE_THIS_VARIABLE =
    greenweb::core::CLogger::instance();
}

namespace greenweb {
namespace core {

CLogger::CLogger()
    : m_Level{E_Debug}, m_Reconfigured{false}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    m_Reconfigured = false;

    boost::shared_ptr<boost::log::core> logCore{boost::log::core::get()};
    logCore->remove_all_sinks();
    logCore->reset_filter();
    logCore->add_global_attribute(TIME_STAMP_ATTRIBUTE,
                                  boost::log::attributes::local_clock{});

    // Having this hardcoded configuration means that the unit tests and
    // other utility programs just work with minimal effort.
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>{&std::cerr, boost::null_deleter{}});
    backend->auto_flush(true);

    using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    auto sink = boost::make_shared<TTextSink>(backend);
    sink->set_formatter(&formatRecord);
    logCore->add_sink(sink);

    this->setLoggingLevel(E_Debug);
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
    throw std::runtime_error("Green web fatal exception");
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

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(
        boost::log::expressions::attr<ELevel>(SEVERITY_ATTRIBUTE) >= level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    static const std::string LEVELS[]{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    static const std::string UNKNOWN{"UNKNOWN"};
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN;
    }
    return LEVELS[level];
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream settingsStrm{propertiesFile};
    if (settingsStrm.is_open() == false) {
        LOG_ERROR(<< "Unable to open properties file " << propertiesFile
                  << " for logger re-initialisation");
        return false;
    }

    if (this->reconfigureFromSettings(settingsStrm) == false) {
        return false;
    }

    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);

    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    try {
        boost::shared_ptr<boost::log::core> logCore{boost::log::core::get()};
        logCore->remove_all_sinks();
        logCore->reset_filter();
        boost::log::init_from_stream(settingsStrm);
        boost::log::add_common_attributes();
    } catch (const std::exception& e) {
        // The sinks are gone so this can only go to the console
        std::cerr << "Failed to reinitialise logger: " << e.what() << std::endl;
        this->reset();
        return false;
    }

    m_Reconfigured = true;

    return true;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    LOG_FATAL(<< message);
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
    if (strm >> name) {
        for (int candidate = CLogger::E_Trace; candidate <= CLogger::E_Fatal; ++candidate) {
            if (CLogger::levelToString(static_cast<CLogger::ELevel>(candidate)) == name) {
                level = static_cast<CLogger::ELevel>(candidate);
                return strm;
            }
        }
        strm.setstate(std::ios_base::failbit);
    }
    return strm;
}
}
}
