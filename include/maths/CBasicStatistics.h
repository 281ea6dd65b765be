/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_maths_CBasicStatistics_h
#define INCLUDED_greenweb_maths_CBasicStatistics_h

#include <maths/ImportExport.h>

#include <boost/operators.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>
#include <string>

namespace greenweb {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Some utilities for computing basic sample statistics such
//! as central moments and the minimum and maximum of a collection.
class MATHS_EXPORT CBasicStatistics {
public:
    //! \brief An accumulator class for sample central moments.
    //!
    //! DESCRIPTION:\n
    //! This function object accumulates sample central moments for a set
    //! of samples passed to its function operator.
    //!
    //! It is capable of calculating the mean and the 2nd central moment.
    //! The moments are updated incrementally rather than from running
    //! sums of powers, which avoids most of the cancellation error when
    //! the mean is large compared to the spread.
    //!
    //! \tparam T The "floating point" type.
    //! \tparam ORDER The highest order moment to gather.
    template<typename T, unsigned int ORDER>
    struct SSampleCentralMoments {
        static_assert(ORDER == 1 || ORDER == 2, "ORDER must be 1 or 2");

        using TValue = T;

        explicit SSampleCentralMoments(const T& initial = T(0)) : s_Count(0) {
            std::fill_n(s_Moments, ORDER, initial);
        }

        //! \name Update
        //@{
        //! Define a function operator for use with std:: algorithms.
        inline void operator()(const T& x) { this->add(x); }

        //! Update the moments with \p x. \p n is the optional number
        //! of times to add \p x.
        void add(const T& x, const T& n = T{1}) {
            if (n == T{0}) {
                return;
            }

            s_Count += n;

            T alpha{n / s_Count};
            T beta{T{1} - alpha};

            T mean{s_Moments[0]};
            s_Moments[0] = beta * mean + alpha * x;

            if (ORDER > 1) {
                T r{x - s_Moments[0]};
                T dMean{mean - s_Moments[0]};
                s_Moments[ORDER - 1] = beta * (s_Moments[ORDER - 1] + dMean * dMean) +
                                       alpha * r * r;
            }
        }

        //! Combine two moments. This is equivalent to running
        //! a single accumulator on the entire collection.
        const SSampleCentralMoments& operator+=(const SSampleCentralMoments& rhs) {
            if (rhs.s_Count == T{0}) {
                return *this;
            }

            s_Count = s_Count + rhs.s_Count;

            T alpha{rhs.s_Count / s_Count};
            T beta{T{1} - alpha};

            T meanLhs{s_Moments[0]};
            T meanRhs{rhs.s_Moments[0]};
            s_Moments[0] = beta * meanLhs + alpha * meanRhs;

            if (ORDER > 1) {
                T dMeanLhs{meanLhs - s_Moments[0]};
                T dMeanRhs{meanRhs - s_Moments[0]};
                s_Moments[ORDER - 1] =
                    beta * (s_Moments[ORDER - 1] + dMeanLhs * dMeanLhs) +
                    alpha * (rhs.s_Moments[ORDER - 1] + dMeanRhs * dMeanRhs);
            }

            return *this;
        }
        //@}

        T s_Count;
        T s_Moments[ORDER];
    };

    //! \name Accumulator Typedefs
    //@{
    //! Accumulator object to compute the sample mean.
    template<typename T>
    struct SSampleMean {
        using TAccumulator = SSampleCentralMoments<T, 1u>;
    };

    //! Accumulator object to compute the sample mean and variance.
    template<typename T>
    struct SSampleMeanVar {
        using TAccumulator = SSampleCentralMoments<T, 2u>;
    };
    //@}

    //! Extract the count from an accumulator object.
    template<typename T, unsigned int N>
    static inline const T& count(const SSampleCentralMoments<T, N>& accumulator) {
        return accumulator.s_Count;
    }

    //! Extract the mean from an accumulator object.
    template<typename T, unsigned int N>
    static inline const T& mean(const SSampleCentralMoments<T, N>& accumulator) {
        return accumulator.s_Moments[0];
    }

    //! Extract the maximum likelihood variance from an accumulator object.
    //!
    //! \note This is the biased, or population, form.
    template<typename T, unsigned int N>
    static inline const T& maximumLikelihoodVariance(const SSampleCentralMoments<T, N>& accumulator) {
        static_assert(N >= 2, "N must be at least 2");
        return accumulator.s_Moments[1];
    }

    //! Print an accumulator object.
    template<typename T, unsigned int N>
    static std::string print(const SSampleCentralMoments<T, N>& accumulator) {
        std::ostringstream result;
        result << '(' << count(accumulator) << ", " << mean(accumulator);
        if (N > 1) {
            result << ", " << accumulator.s_Moments[N - 1];
        }
        result << ')';
        return result.str();
    }

    //! \brief An accumulator of the minimum and maximum value in a collection.
    template<typename T>
    class CMinMax : boost::addable<CMinMax<T>> {
    public:
        //! Define a function operator for use with std:: algorithms.
        inline void operator()(const T& x) { this->add(x); }

        //! Update the statistic with \p x.
        void add(const T& x) {
            if (m_Initialized == false) {
                m_Min = x;
                m_Max = x;
                m_Initialized = true;
                return;
            }
            m_Min = std::min(m_Min, x);
            m_Max = std::max(m_Max, x);
        }

        //! Combine two statistics.
        const CMinMax& operator+=(const CMinMax& rhs) {
            if (rhs.m_Initialized) {
                this->add(rhs.m_Min);
                this->add(rhs.m_Max);
            }
            return *this;
        }

        //! Has any value been added?
        bool initialized() const { return m_Initialized; }

        //! Get the minimum value.
        T min() const { return m_Min; }

        //! Get the maximum value.
        T max() const { return m_Max; }


    private:
        bool m_Initialized{false};
        T m_Min{};
        T m_Max{};
    };
};

template<typename T, unsigned int N>
std::ostream& operator<<(std::ostream& o,
                         const CBasicStatistics::SSampleCentralMoments<T, N>& accumulator) {
    return o << CBasicStatistics::print(accumulator);
}
}
}

#endif // INCLUDED_greenweb_maths_CBasicStatistics_h
