/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef DESCRIPTORS__LINEAR_TRANSFORM_HPP
#define DESCRIPTORS__LINEAR_TRANSFORM_HPP

#include "../util/types.hpp"

namespace w2cv {

/**
 * @ingroup descriptors
 * @brief Pre-fitted projection y = M * (x - offset), e.g. the result of a PCA.
 *
 * M is a k x d matrix, offset a vector of length d. On disk a transform is a property
 * file of vec_f32_t elements: element 0 holds the offset, elements 1..k hold the rows
 * of M.
 */
class LinearTransform
{
    public:

    /// @throws DimensionMismatch if offset.size() != matrix.cols
    LinearTransform(const cv::Mat_<float>& matrix, const vec_f32_t& offset);

    /// @throws MissingTransform if the file is absent or malformed
    static shared_ptr<LinearTransform> load(const string& filename);

    void save(const string& filename) const;

    /// @throws DimensionMismatch if x.size() != input_size()
    vec_f32_t apply(const vec_f32_t& x) const;

    size_t input_size() const { return _offset.size(); }
    size_t output_size() const { return _matrix.rows; }

    const cv::Mat_<float>& matrix() const { return _matrix; }
    const vec_f32_t& offset() const { return _offset; }

    private:

    cv::Mat_<float> _matrix;
    vec_f32_t       _offset;
};

} // namespace w2cv

#endif // DESCRIPTORS__LINEAR_TRANSFORM_HPP
