/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <cmath>

#include "converter.hpp"
#include "../util/errors.hpp"

namespace w2cv {

ColorConverter::ColorConverter(shared_ptr<const ColorTable> table)
    : _table(table)
{
    if (!_table) throw MissingColorTable("no color table available for color conversion");
}

mat_32fc3_t ColorConverter::convert(const cv::Mat& raw) const
{
    if (raw.empty()) throw InvalidPixelRange("empty image");
    if (raw.channels() != 3)
    {
        throw InvalidPixelRange("expected 3 channels, image has " + boost::lexical_cast<string>(raw.channels()));
    }

    // everything but 8-bit needs a range check first. CV_64F represents
    // all values of the other depths exactly.
    mat_8uc3_t image;
    if (raw.depth() == CV_8U)
    {
        image = raw;
    }
    else
    {
        cv::Mat_<cv::Vec3d> values;
        raw.convertTo(values, CV_64FC3);

        image.create(raw.size());
        for (int y = 0; y < values.rows; y++)
        for (int x = 0; x < values.cols; x++)
        {
            const cv::Vec3d& v = values(y, x);
            for (int c = 0; c < 3; c++)
            {
                if (!(v[c] >= 0.0 && v[c] <= 255.0) || std::floor(v[c]) != v[c])
                {
                    throw InvalidPixelRange("pixel (" + boost::lexical_cast<string>(x) + ","
                                            + boost::lexical_cast<string>(y) + ") has value "
                                            + boost::lexical_cast<string>(v[c]) + " outside of [0,255]");
                }
                image(y, x)[c] = static_cast<uchar>(v[c]);
            }
        }
    }

    mat_32fc3_t result(image.size());

    const ColorTable& table = *_table;
    for (int y = 0; y < image.rows; y++)
    {
        const cv::Vec3b* src = image[y];
        cv::Vec3f* dst = result[y];
        for (int x = 0; x < image.cols; x++)
        {
            // BGR -> RGB lookup
            dst[x] = table.lookup(src[x][2], src[x][1], src[x][0]);
        }
    }

    return result;
}

} // namespace w2cv
