/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef COLOR__COLOR_SPACES_HPP
#define COLOR__COLOR_SPACES_HPP

#include <boost/cstdint.hpp>

namespace w2cv {

/**
 * @ingroup color
 * @brief Closed-form conversions from 8-bit sRGB into perceptual color spaces.
 *
 * These are far too slow to be evaluated per pixel, they are used to precompute
 * a LookupColorTable once (see generate_color_table) which is then shared by all
 * images.
 */
namespace colorspace
{
    /// sRGB component in [0,1] to linear light
    double srgb_to_linear(double v);

    /// 8-bit sRGB to CIE XYZ (D65), Y of the white point is 1
    void srgb_to_xyz(uint8_t r, uint8_t g, uint8_t b, double xyz[3]);

    /**
     * @brief 8-bit sRGB to JzAzBz (Safdar et al., Optics Express 2017).
     *
     * JzAzBz expects absolute XYZ in cd/m^2, the relative XYZ of sRGB is scaled by
     * the luminance of the display white.
     *
     * @param luminance luminance of sRGB white in cd/m^2
     */
    void srgb_to_jzazbz(uint8_t r, uint8_t g, uint8_t b, double luminance, double jab[3]);

    /// 8-bit sRGB to CIE L*a*b* (D65), L in [0,100]
    void srgb_to_lab(uint8_t r, uint8_t g, uint8_t b, double lab[3]);
}

} // namespace w2cv

#endif // COLOR__COLOR_SPACES_HPP
