/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CIntelligenceConfig_h
#define INCLUDED_greenweb_carbon_CIntelligenceConfig_h

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CoreTypes.h>

#include <carbon/ImportExport.h>

#include <boost/property_tree/ptree.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace greenweb {
namespace carbon {

//! \brief
//! Holds configuration for the carbon intelligence service.
//!
//! DESCRIPTION:\n
//! Holds how much history to learn from, how much is needed, how often
//! patterns are refreshed and which regions are known to swing widely.
//! Defaults are set by the constructor and can be overridden from an
//! ini style config file, for example:
//!
//! [history]
//! retentiondays = 30
//! [analysis]
//! mindatapoints = 168
//! [refresh]
//! updateinterval = 900
//! timeout = 300
//! workerthreads = 2
//! [regions]
//! highvariation = PL, US-TEX, CN
//!
//! IMPLEMENTATION DECISIONS:\n
//! The file is read with boost::property_tree but each value is converted
//! with CStringUtils, which is much stricter.  Settings missing from the
//! file keep their defaults.  An invalid value fails the whole load and
//! leaves the object unchanged.
//!
class CARBON_EXPORT CIntelligenceConfig {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Default number of days of history to learn from
    static const std::size_t DEFAULT_HISTORY_RETENTION_DAYS;
    //! Default minimum number of samples needed to learn a pattern
    static const std::size_t DEFAULT_MIN_DATA_POINTS;
    //! Default age in seconds after which a pattern is stale
    static const core_t::TTime DEFAULT_UPDATE_INTERVAL;
    //! Default seconds a single refresh may take
    static const core_t::TTime DEFAULT_REFRESH_TIMEOUT;
    //! Default size of the pattern computation thread pool
    static const std::size_t DEFAULT_WORKER_THREADS;
    //! Regions with a known history of high variation
    static const TStrVec DEFAULT_HIGH_VARIATION_REGIONS;

public:
    CIntelligenceConfig();

    //! Initialise from a config file.
    bool init(const std::string& configFile);

    //! Initialise from a stream in the config file format.
    bool init(std::istream& strm, const std::string& description);

    std::size_t historyRetentionDays() const;
    void historyRetentionDays(std::size_t days);

    std::size_t minDataPointsForAnalysis() const;
    void minDataPointsForAnalysis(std::size_t count);

    core_t::TTime updateInterval() const;
    void updateInterval(core_t::TTime seconds);

    core_t::TTime refreshTimeout() const;
    void refreshTimeout(core_t::TTime seconds);

    std::size_t workerThreads() const;
    void workerThreads(std::size_t threads);

    //! Is \p region in the high variation list?  This is an exact, case
    //! sensitive match.
    bool isHighVariationRegion(const std::string& region) const;

private:
    template<typename FIELDTYPE>
    static bool processSetting(const boost::property_tree::ptree& propTree,
                               const std::string& iniPath,
                               const FIELDTYPE& defaultValue,
                               FIELDTYPE& value) {
        auto valueStr = propTree.get_optional<std::string>(iniPath);
        if (!valueStr) {
            LOG_DEBUG(<< "Using default value (" << defaultValue
                      << ") for unspecified setting " << iniPath);
            value = defaultValue;
            return true;
        }
        // Use our own string-to-type conversion, because what's built
        // into the boost::property_tree is too lax
        std::string trimmed{*valueStr};
        core::CStringUtils::trimWhitespace(trimmed);
        if (core::CStringUtils::stringToType(trimmed, value) == false) {
            LOG_ERROR(<< "Invalid value for setting " << iniPath << " : " << *valueStr);
            return false;
        }
        return true;
    }

    static bool parseRegions(const std::string& list, TStrVec& regions);

private:
    std::size_t m_HistoryRetentionDays;
    std::size_t m_MinDataPointsForAnalysis;
    core_t::TTime m_UpdateInterval;
    core_t::TTime m_RefreshTimeout;
    std::size_t m_WorkerThreads;
    TStrVec m_HighVariationRegions;
};
}
}

#endif // INCLUDED_greenweb_carbon_CIntelligenceConfig_h
