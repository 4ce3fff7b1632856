/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef AGGREGATE__WORD_VECTOR_HPP
#define AGGREGATE__WORD_VECTOR_HPP

#include "../util/types.hpp"
#include "../util/running_stats.hpp"

namespace w2cv {

/**
 * @ingroup aggregate
 * @brief Aggregated color representation of a word within one revision.
 *
 * Holds the running statistics of all feature vectors that have been contributed
 * to (word, revision). Once handed out by the store, stats.count() is at least 1.
 */
struct WordVector
{
    WordVector() {}
    WordVector(const string& word_, const string& revision_, const RunningStats& stats_)
        : word(word_), revision(revision_), stats(stats_)
    {}

    uint64_t count() const { return stats.count(); }
    const vec_f64_t& mean() const { return stats.mean(); }
    vec_f64_t variance() const { return stats.variance(); }

    string       word;
    string       revision;
    RunningStats stats;
};

/**
 * @brief Combines two aggregates of the same word and revision.
 *
 * Count-weighted mean and pooled M2, commutative and, up to rounding, associative.
 *
 * @throws IncompatibleVectors if word or revision differ
 * @throws DimensionMismatch if both are non-empty and differ in length
 */
WordVector merge(const WordVector& a, const WordVector& b);

} // namespace w2cv

#endif // AGGREGATE__WORD_VECTOR_HPP
