/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CIntelligenceConfig.h>

#include <core/CStreamUtils.h>

#include <boost/property_tree/ini_parser.hpp>

#include <algorithm>
#include <fstream>

namespace greenweb {
namespace carbon {

const std::size_t CIntelligenceConfig::DEFAULT_HISTORY_RETENTION_DAYS(30);
const std::size_t CIntelligenceConfig::DEFAULT_MIN_DATA_POINTS(168);
const core_t::TTime CIntelligenceConfig::DEFAULT_UPDATE_INTERVAL(900);
const core_t::TTime CIntelligenceConfig::DEFAULT_REFRESH_TIMEOUT(300);
const std::size_t CIntelligenceConfig::DEFAULT_WORKER_THREADS(2);
// Both the grid codes and the names used by older clients are listed
const CIntelligenceConfig::TStrVec CIntelligenceConfig::DEFAULT_HIGH_VARIATION_REGIONS{
    "PL",  "Poland", "US-TEX", "Texas",        "CN", "China",
    "IN",  "India",  "AU-NSW", "Australia-NSW", "ZA", "South Africa"};

CIntelligenceConfig::CIntelligenceConfig()
    : m_HistoryRetentionDays{DEFAULT_HISTORY_RETENTION_DAYS},
      m_MinDataPointsForAnalysis{DEFAULT_MIN_DATA_POINTS},
      m_UpdateInterval{DEFAULT_UPDATE_INTERVAL}, m_RefreshTimeout{DEFAULT_REFRESH_TIMEOUT},
      m_WorkerThreads{DEFAULT_WORKER_THREADS}, m_HighVariationRegions{DEFAULT_HIGH_VARIATION_REGIONS} {
}

bool CIntelligenceConfig::init(const std::string& configFile) {
    std::ifstream strm(configFile.c_str());
    if (!strm.is_open()) {
        LOG_ERROR(<< "Error opening config file " << configFile);
        return false;
    }
    return this->init(strm, configFile);
}

bool CIntelligenceConfig::init(std::istream& strm, const std::string& description) {
    boost::property_tree::ptree propTree;
    try {
        core::CStreamUtils::skipUtf8Bom(strm);
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config file " << description << " : " << e.what());
        return false;
    }

    CIntelligenceConfig parsed;
    std::string highVariation;
    if (processSetting(propTree, "history.retentiondays", DEFAULT_HISTORY_RETENTION_DAYS,
                       parsed.m_HistoryRetentionDays) == false ||
        processSetting(propTree, "analysis.mindatapoints", DEFAULT_MIN_DATA_POINTS,
                       parsed.m_MinDataPointsForAnalysis) == false ||
        processSetting(propTree, "refresh.updateinterval", DEFAULT_UPDATE_INTERVAL,
                       parsed.m_UpdateInterval) == false ||
        processSetting(propTree, "refresh.timeout", DEFAULT_REFRESH_TIMEOUT,
                       parsed.m_RefreshTimeout) == false ||
        processSetting(propTree, "refresh.workerthreads", DEFAULT_WORKER_THREADS,
                       parsed.m_WorkerThreads) == false ||
        processSetting(propTree, "regions.highvariation",
                       core::CStringUtils::join(DEFAULT_HIGH_VARIATION_REGIONS, ","),
                       highVariation) == false ||
        parseRegions(highVariation, parsed.m_HighVariationRegions) == false) {
        LOG_ERROR(<< "Error processing config file " << description);
        return false;
    }

    if (parsed.m_HistoryRetentionDays == 0 || parsed.m_WorkerThreads == 0 ||
        parsed.m_UpdateInterval <= 0 || parsed.m_RefreshTimeout <= 0) {
        LOG_ERROR(<< "Retention, update interval, refresh timeout and worker"
                     " threads must all be positive in "
                  << description);
        return false;
    }

    *this = std::move(parsed);
    return true;
}

std::size_t CIntelligenceConfig::historyRetentionDays() const {
    return m_HistoryRetentionDays;
}

void CIntelligenceConfig::historyRetentionDays(std::size_t days) {
    m_HistoryRetentionDays = days;
}

std::size_t CIntelligenceConfig::minDataPointsForAnalysis() const {
    return m_MinDataPointsForAnalysis;
}

void CIntelligenceConfig::minDataPointsForAnalysis(std::size_t count) {
    m_MinDataPointsForAnalysis = count;
}

core_t::TTime CIntelligenceConfig::updateInterval() const {
    return m_UpdateInterval;
}

void CIntelligenceConfig::updateInterval(core_t::TTime seconds) {
    m_UpdateInterval = seconds;
}

core_t::TTime CIntelligenceConfig::refreshTimeout() const {
    return m_RefreshTimeout;
}

void CIntelligenceConfig::refreshTimeout(core_t::TTime seconds) {
    m_RefreshTimeout = seconds;
}

std::size_t CIntelligenceConfig::workerThreads() const {
    return m_WorkerThreads;
}

void CIntelligenceConfig::workerThreads(std::size_t threads) {
    m_WorkerThreads = threads;
}

bool CIntelligenceConfig::isHighVariationRegion(const std::string& region) const {
    return std::find(m_HighVariationRegions.begin(), m_HighVariationRegions.end(),
                     region) != m_HighVariationRegions.end();
}

bool CIntelligenceConfig::parseRegions(const std::string& list, TStrVec& regions) {
    TStrVec tokens;
    std::string remainder;
    core::CStringUtils::tokenise(",", list, tokens, remainder);
    tokens.push_back(remainder);

    regions.clear();
    for (auto& token : tokens) {
        core::CStringUtils::trimWhitespace(token);
        if (token.empty() == false) {
            regions.push_back(token);
        }
    }
    return true;
}
}
}
