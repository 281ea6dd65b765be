/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CarbonTypes_h
#define INCLUDED_greenweb_carbon_CarbonTypes_h

#include <core/CoreTypes.h>

#include <carbon/ImportExport.h>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace greenweb {
namespace carbon {

//! A single historical reading of a region's grid.
struct CARBON_EXPORT SHistoricalSample {
    //! UTC seconds since the epoch.
    core_t::TTime s_Time{0};
    //! g CO2 per kWh.
    double s_CarbonIntensity{0.0};
    //! 0 to 100.
    double s_RenewablePercent{0.0};
};

using TSampleVec = std::vector<SHistoricalSample>;
using TIntVec = std::vector<int>;
using TStrVec = std::vector<std::string>;

//! The direction of the least squares trend through a sample.
enum ETrendDirection { E_Improving, E_Worsening, E_Stable };

//! Classification of a reading against its region's own thresholds.
enum ERelativeMode { E_Clean, E_Average, E_Dirty };

CARBON_EXPORT const std::string& print(ETrendDirection direction);
CARBON_EXPORT const std::string& print(ERelativeMode mode);
CARBON_EXPORT std::ostream& operator<<(std::ostream& o, ETrendDirection direction);
CARBON_EXPORT std::ostream& operator<<(std::ostream& o, ERelativeMode mode);

//! The latest reading for a region as reported by a data source.
struct CARBON_EXPORT SCurrentIntensity {
    //! Absolute classification, "green" below 150 g CO2/kWh, "yellow"
    //! below 300 and "red" otherwise.
    static std::string absoluteMode(double carbonIntensity);

    //! "optimal", "reduce" or "defer" matching absoluteMode().
    static std::string recommendation(double carbonIntensity);

    std::string s_Location;
    double s_CarbonIntensity{0.0};
    double s_RenewablePercent{0.0};
    std::string s_Mode;
    std::string s_Recommendation;
    core_t::TTime s_Time{0};
    std::string s_Source;
};

//! A forecast low carbon window.
struct CARBON_EXPORT SGreenHour {
    core_t::TTime s_Start{0};
    core_t::TTime s_End{0};
    double s_CarbonIntensity{0.0};
    double s_RenewablePercent{0.0};
    //! 0 to 100.
    double s_Confidence{0.0};
};

using TGreenHourVec = std::vector<SGreenHour>;

//! A forecast of the green hours for a region.
struct CARBON_EXPORT SGreenHoursForecast {
    std::string s_Location;
    TGreenHourVec s_GreenHours;
    SGreenHour s_BestWindow;
    core_t::TTime s_PeriodStart{0};
    core_t::TTime s_PeriodEnd{0};
    core_t::TTime s_GeneratedAt{0};
    std::string s_Source;
    double s_Confidence{0.0};
    double s_AverageIntensity{0.0};
};

//! The predicted next low carbon hour.
struct CARBON_EXPORT SOptimalWindow {
    core_t::TTime s_Start{0};
    core_t::TTime s_End{0};
    double s_ExpectedIntensity{0.0};
    double s_Confidence{0.0};
    std::string s_Reason;
};

using TOptionalOptimalWindow = std::optional<SOptimalWindow>;

//! A current reading placed in the context of its region's history.
//!
//! When no regional pattern is available s_HasRelativeMetrics is false,
//! the percentile is 50, the confidence is 0.5 and the other relative
//! fields keep their default values.
struct CARBON_EXPORT SRelativeCarbonIntensity {
    SCurrentIntensity s_Current;
    bool s_HasRelativeMetrics{false};
    double s_LocalPercentile{50.0};
    std::string s_DailyRank;
    ERelativeMode s_RelativeMode{E_Average};
    ETrendDirection s_TrendDirection{E_Stable};
    double s_TrendMagnitude{0.0};
    TOptionalOptimalWindow s_NextOptimalWindow;
    double s_ConfidenceScore{0.5};
    double s_RegionalBaseline{0.0};
    bool s_IsHighVariation{false};
};

//! Summary statistics of a region's history over a period.
struct CARBON_EXPORT SCarbonTrend {
    using TOptionalDouble = std::optional<double>;

    std::string s_Location;
    std::string s_Period;
    core_t::TTime s_Start{0};
    core_t::TTime s_End{0};
    double s_AverageIntensity{0.0};
    double s_MinIntensity{0.0};
    double s_MaxIntensity{0.0};
    double s_StdDeviation{0.0};
    //! Up to three hours of day, cleanest first.
    TIntVec s_CleanestHours;
    //! Up to three hours of day, dirtiest first.
    TIntVec s_DirtiestHours;
    TOptionalDouble s_WeekdayAverage;
    TOptionalDouble s_WeekendAverage;
    //! Only populated for short daily reports.
    TSampleVec s_Samples;
};

//! Static scheduling advice for a region.
struct CARBON_EXPORT SRegionalStrategy {
    std::string s_Region;
    std::string s_PrimaryEnergySource;
    TIntVec s_OptimalHours;
    TIntVec s_AvoidanceHours;
    std::string s_VariationLevel;
    TStrVec s_Recommendations;
};
}
}

#endif // INCLUDED_greenweb_carbon_CarbonTypes_h
