/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef AGGREGATE__AGGREGATOR_HPP
#define AGGREGATE__AGGREGATOR_HPP

#include "../util/types.hpp"
#include "../descriptors/feature_vector.hpp"
#include "word_vector.hpp"

namespace w2cv {

class VectorStore;

/**
 * @ingroup aggregate
 * @brief Accumulates feature vectors into the word vectors of a VectorStore.
 *
 * The aggregator holds no state of its own, all running statistics live in the store
 * which serializes concurrent contributions to the same (word, revision). Contributing
 * the same vectors in any order gives the same word vector up to rounding.
 */
class Aggregator
{
    public:

    explicit Aggregator(VectorStore& store);

    /**
     * @brief Adds v to the running statistics of (word, revision).
     * @return the updated word vector
     * @throws DimensionMismatch if v differs in length from earlier contributions, the
     * word vector is left unchanged
     * @throws RevisionFinalized if revision is finalized
     */
    WordVector contribute(const string& word, const string& revision, const FeatureVector& v);

    /// Shorthand for contribute(v.word, v.revision, v)
    WordVector contribute(const FeatureVector& v);

    /**
     * @brief Stores the feature vector of one image and contributes it to its word vector.
     *
     * Stored feature vectors and word vector stay consistent: on any exception neither
     * is changed.
     *
     * @throws DuplicateImage if the image is already part of (v.word, v.revision)
     * @throws DimensionMismatch as contribute()
     * @throws RevisionFinalized if v.revision is finalized
     */
    WordVector add_image(const FeatureVector& v);

    /// @see merge(const WordVector&, const WordVector&)
    static WordVector merge(const WordVector& a, const WordVector& b);

    private:

    static void _add(RunningStats& stats, const vec_f32_t& values);

    VectorStore& _store;
};

} // namespace w2cv

#endif // AGGREGATE__AGGREGATOR_HPP
