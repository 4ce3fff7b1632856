/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "feature_extractor.hpp"
#include "../util/errors.hpp"

namespace w2cv {

FeatureExtractor::FeatureExtractor(const ptree& params, const ColorgramShape& shape,
                                   shared_ptr<const LinearTransform> transform)
    : _parameters(params)
    , _shape(shape)
    , _histogram     (parse<bool>(_parameters, "features.histogram"     , true)) // flattened histograms
    , _moments       (parse<bool>(_parameters, "features.moments"       , true)) // mean and variance per cell
    , _wavelet_levels(parse<int> (_parameters, "features.wavelet_levels", 0   )) // haar levels, 0 = off
    , _wavelet_size(0)
    , _base_length(0)
    , _transform(transform)
{
    string transform_file = parse<string>(_parameters, "features.transform", "");

    if (_wavelet_levels < 0) throw std::invalid_argument("features.wavelet_levels must be >= 0");
    if (!_histogram && !_moments && _wavelet_levels == 0)
    {
        throw std::invalid_argument("feature extractor: histogram, moments and wavelet part are all disabled");
    }

    const size_t cells = _shape.num_cells();
    if (_histogram) _base_length += cells * _shape.histogram_size();
    if (_moments)   _base_length += cells * 6;
    if (_wavelet_levels > 0)
    {
        _wavelet_size = 1;
        while (_wavelet_size < _shape.histogram_size()) _wavelet_size *= 2;
        _base_length += _wavelet_size;
    }

    if (!transform_file.empty() && !_transform)
    {
        throw MissingTransform("transform " + transform_file + " is configured but has not been loaded");
    }

    if (_transform && _transform->input_size() != _base_length)
    {
        throw DimensionMismatch("transform expects input of length " + boost::lexical_cast<string>(_transform->input_size())
                                + ", feature extractor produces " + boost::lexical_cast<string>(_base_length));
    }
}

size_t FeatureExtractor::length() const
{
    return _transform ? _transform->output_size() : _base_length;
}

vec_f32_t FeatureExtractor::compute(const Colorgram& colorgram) const
{
    if (colorgram.shape != _shape || !colorgram.consistent())
    {
        throw DimensionMismatch("colorgram does not have the shape the feature extractor is configured for");
    }

    const size_t cells = _shape.num_cells();

    vec_f32_t features;
    features.reserve(_base_length);

    if (_histogram)
    {
        features.insert(features.end(), colorgram.histograms.begin(), colorgram.histograms.end());
    }

    if (_moments)
    {
        for (size_t cell = 0; cell < cells; cell++)
        {
            for (int c = 0; c < 3; c++) features.push_back(colorgram.means[cell * 3 + c]);
            for (int c = 0; c < 3; c++) features.push_back(colorgram.variances[cell * 3 + c]);
        }
    }

    if (_wavelet_levels > 0)
    {
        size_t offset = features.size();
        features.resize(offset + _wavelet_size, 0.0f);
        haar(colorgram.histogram(0), &features[offset]);
    }

    if (_transform) return _transform->apply(features);
    return features;
}

void FeatureExtractor::haar(const float* histogram, float* out) const
{
    const size_t hs = _shape.histogram_size();

    vec_f32_t data(_wavelet_size, 0.0f);
    std::copy(histogram, histogram + hs, data.begin());

    // standard decomposition: averages go to the front half, details to the
    // back half, the next level continues on the averages only
    const float s = static_cast<float>(1.0 / std::sqrt(2.0));
    vec_f32_t tmp(_wavelet_size);
    size_t n = _wavelet_size;
    for (int level = 0; level < _wavelet_levels && n > 1; level++)
    {
        size_t half = n / 2;
        for (size_t i = 0; i < half; i++)
        {
            tmp[i]        = (data[2 * i] + data[2 * i + 1]) * s;
            tmp[half + i] = (data[2 * i] - data[2 * i + 1]) * s;
        }
        std::copy(tmp.begin(), tmp.begin() + n, data.begin());
        n = half;
    }

    std::copy(data.begin(), data.end(), out);
}

} // namespace w2cv
