/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef COLOR__CONVERTER_HPP
#define COLOR__CONVERTER_HPP

#include "../util/types.hpp"
#include "color_table.hpp"

namespace w2cv {

/**
 * @ingroup color
 * @brief Maps raw device RGB images into the perceptual space of a ColorTable.
 *
 * The conversion is a pure function of the image and the table: converting the same
 * image twice with the same table gives bit-identical results.
 */
class ColorConverter
{
    public:

    /// @throws MissingColorTable if table is null
    explicit ColorConverter(shared_ptr<const ColorTable> table);

    /**
     * @brief Converts a raw image into a perceptual image of the same size.
     *
     * The image is expected in OpenCV's channel order, i.e. BGR, as returned by cv::imread.
     * 8-bit 3-channel images are always valid. Images of any other depth are accepted
     * if every value is an integer in [0,255].
     *
     * @throws InvalidPixelRange if the image is empty, does not have 3 channels or contains
     * values that are not valid table indices
     */
    mat_32fc3_t convert(const cv::Mat& raw) const;

    const ColorTable& table() const { return *_table; }

    private:

    shared_ptr<const ColorTable> _table;
};

} // namespace w2cv

#endif // COLOR__CONVERTER_HPP
