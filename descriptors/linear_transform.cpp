/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>
#include <stdexcept>

#include "linear_transform.hpp"
#include "../io/property_reader.hpp"
#include "../io/property_writer.hpp"
#include "../util/errors.hpp"

namespace w2cv {

LinearTransform::LinearTransform(const cv::Mat_<float>& matrix, const vec_f32_t& offset)
    : _matrix(matrix.clone())
    , _offset(offset)
{
    if (static_cast<size_t>(_matrix.cols) != _offset.size())
    {
        throw DimensionMismatch("transform matrix has " + boost::lexical_cast<string>(_matrix.cols)
                                + " columns but offset has length " + boost::lexical_cast<string>(_offset.size()));
    }
}

shared_ptr<LinearTransform> LinearTransform::load(const string& filename)
{
    vec_vec_f32_t elements;
    try
    {
        read_property(elements, filename);
    }
    catch (const std::exception& e)
    {
        throw MissingTransform("cannot load transform from " + filename + ": " + e.what());
    }

    if (elements.size() < 2)
    {
        throw MissingTransform("transform " + filename + " needs an offset and at least one row");
    }

    const vec_f32_t& offset = elements[0];
    cv::Mat_<float> matrix(static_cast<int>(elements.size() - 1), static_cast<int>(offset.size()));
    for (size_t r = 1; r < elements.size(); r++)
    {
        if (elements[r].size() != offset.size())
        {
            throw MissingTransform("transform " + filename + ": row " + boost::lexical_cast<string>(r - 1)
                                   + " has length " + boost::lexical_cast<string>(elements[r].size())
                                   + ", expected " + boost::lexical_cast<string>(offset.size()));
        }
        std::copy(elements[r].begin(), elements[r].end(), matrix[r - 1]);
    }

    return make_shared<LinearTransform>(matrix, offset);
}

void LinearTransform::save(const string& filename) const
{
    PropertyWriterT<vec_f32_t> writer(filename);
    writer.push_back_value(_offset);
    for (int r = 0; r < _matrix.rows; r++)
    {
        writer.push_back_value(vec_f32_t(_matrix[r], _matrix[r] + _matrix.cols));
    }
    writer.close();
}

vec_f32_t LinearTransform::apply(const vec_f32_t& x) const
{
    if (x.size() != _offset.size())
    {
        throw DimensionMismatch("transform expects input of length " + boost::lexical_cast<string>(_offset.size())
                                + ", got " + boost::lexical_cast<string>(x.size()));
    }

    cv::Mat_<float> centered(static_cast<int>(x.size()), 1);
    for (size_t i = 0; i < x.size(); i++) centered(i, 0) = x[i] - _offset[i];

    cv::Mat_<float> projected = _matrix * centered;
    return vec_f32_t(projected.begin(), projected.end());
}

} // namespace w2cv
