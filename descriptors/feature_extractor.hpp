/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef DESCRIPTORS__FEATURE_EXTRACTOR_HPP
#define DESCRIPTORS__FEATURE_EXTRACTOR_HPP

#include "../util/types.hpp"
#include "colorgram.hpp"
#include "linear_transform.hpp"

namespace w2cv {

/**
 * @ingroup descriptors
 * @brief Turns a Colorgram into a fixed-length feature vector.
 *
 * The vector is the concatenation of
 * -# the histograms of all cells of all levels (features.histogram [true])
 * -# mean and variance of the three channels per cell, in this order (features.moments [true])
 * -# the Haar wavelet coefficients of the level 0 histogram, zero padded to the next
 *    power of two (features.wavelet_levels [0], 0 disables this part)
 *
 * If a LinearTransform is given, the result is the projection of this concatenation.
 * features.transform holds the filename the transform has been loaded from.
 */
class FeatureExtractor
{
    public:

    /**
     * @throws MissingTransform if features.transform names a file but transform is null
     * @throws DimensionMismatch if the transform does not accept the concatenation length
     * @throws std::invalid_argument if all parts are disabled
     */
    FeatureExtractor(const ptree& params, const ColorgramShape& shape,
                     shared_ptr<const LinearTransform> transform = shared_ptr<const LinearTransform>());

    /// @throws DimensionMismatch if the shape of the colorgram differs from the configured one
    vec_f32_t compute(const Colorgram& colorgram) const;

    /// Length of the vectors returned by compute()
    size_t length() const;

    /// Length of the concatenation before the transform
    size_t base_length() const { return _base_length; }

    const ptree& parameters() const { return _parameters; }

    private:

    void haar(const float* histogram, float* out) const;

    ptree          _parameters;
    ColorgramShape _shape;
    bool           _histogram;
    bool           _moments;
    int            _wavelet_levels;
    size_t         _wavelet_size;
    size_t         _base_length;

    shared_ptr<const LinearTransform> _transform;
};

} // namespace w2cv

#endif // DESCRIPTORS__FEATURE_EXTRACTOR_HPP
