/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef UTIL__RUNNING_STATS_HPP
#define UTIL__RUNNING_STATS_HPP

#include "types.hpp"

namespace w2cv {

/**
 * @ingroup util
 * @brief Component-wise running count, mean and variance of a stream of vectors.
 *
 * Samples are added with Welford's update, partial results are combined with the
 * pairwise formula of Chan et al. Both avoid the cancellation of the naive
 * sum/sum-of-squares approach. Internally we keep M2, the sum of squared deviations
 * from the mean, variance() is the population variance M2/count.
 *
 * A default constructed instance has dimension 0 and adopts the dimension of the
 * first sample added.
 */
class RunningStats
{
    public:

    RunningStats();
    explicit RunningStats(size_t dim);

    /**
     * @brief Rebuilds running statistics from stored moments.
     * @throws DimensionMismatch if mean and m2 differ in length
     */
    RunningStats(uint64_t count, const vec_f64_t& mean, const vec_f64_t& m2);

    /// @throws DimensionMismatch if sample has a different dimension, the statistics stay unchanged
    void add(const vec_f32_t& sample);

    /// Unchecked variant for hot loops, sample must point to dim() values
    void add(const double* sample);

    /**
     * @brief Combines two partial results as if all samples had been added to one instance.
     *
     * The result is independent of the argument order and, up to floating point rounding,
     * of the grouping of several merges.
     *
     * @throws DimensionMismatch if both are non-empty and differ in dimension
     */
    static RunningStats merge(const RunningStats& a, const RunningStats& b);

    uint64_t count() const { return _count; }
    size_t dim() const { return _mean.size(); }

    const vec_f64_t& mean() const { return _mean; }
    const vec_f64_t& m2() const { return _m2; }

    /// Population variance, all zeros as long as count() == 0
    vec_f64_t variance() const;

    private:

    uint64_t  _count;
    vec_f64_t _mean;
    vec_f64_t _m2;
};

} // namespace w2cv

#endif // UTIL__RUNNING_STATS_HPP
