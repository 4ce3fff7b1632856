/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef DESCRIPTORS__FEATURE_VECTOR_HPP
#define DESCRIPTORS__FEATURE_VECTOR_HPP

#include "../util/types.hpp"

namespace w2cv {

/**
 * @ingroup descriptors
 * @brief Fixed-length color representation of a single image.
 *
 * The length of values is determined by the FeatureExtractor configuration. word and
 * revision identify the aggregate the vector contributes to, image_id is the image's
 * filename relative to the root directory, timestamp is in milliseconds since epoch.
 */
struct FeatureVector
{
    FeatureVector() : timestamp(0) {}

    vec_f32_t values;
    string    image_id;
    string    word;
    string    revision;
    int64_t   timestamp;
};

} // namespace w2cv

#endif // DESCRIPTORS__FEATURE_VECTOR_HPP
