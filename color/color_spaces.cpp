/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>
#include <cmath>

#include "color_spaces.hpp"

namespace w2cv {
namespace colorspace {

namespace {

// sRGB primaries to XYZ, D65 white
const double rgb_to_xyz[3][3] = {
    {0.4124564, 0.3575761, 0.1804375},
    {0.2126729, 0.7151522, 0.0721750},
    {0.0193339, 0.1191920, 0.9503041}
};

const double d65_white[3] = {0.95047, 1.0, 1.08883};

// JzAzBz constants as published by Safdar et al.
const double jz_b  = 1.15;
const double jz_g  = 0.66;
const double jz_c1 = 3424.0 / 4096.0;
const double jz_c2 = 2413.0 / 128.0;
const double jz_c3 = 2392.0 / 128.0;
const double jz_n  = 2610.0 / 16384.0;
const double jz_p  = 1.7 * 2523.0 / 32.0;
const double jz_d  = -0.56;
const double jz_d0 = 1.6295499532821566e-11;

const double xyz_to_lms[3][3] = {
    { 0.41478972, 0.579999, 0.0146480},
    {-0.2015100,  1.120649, 0.0531008},
    {-0.0166008,  0.264800, 0.6684799}
};

const double lms_to_iab[3][3] = {
    {0.5,       0.5,       0.0     },
    {3.524000, -4.066708,  0.542708},
    {0.199076,  1.096799, -1.295875}
};

// perceptual quantizer (SMPTE ST 2084) on a value normalized to 10000 cd/m^2
double pq(double v)
{
    double vn = std::pow(std::max(v, 0.0) / 10000.0, jz_n);
    return std::pow((jz_c1 + jz_c2 * vn) / (1.0 + jz_c3 * vn), jz_p);
}

double lab_f(double t)
{
    const double epsilon = 216.0 / 24389.0;
    const double kappa   = 24389.0 / 27.0;
    return (t > epsilon) ? std::pow(t, 1.0 / 3.0) : (kappa * t + 16.0) / 116.0;
}

} // anonymous namespace


double srgb_to_linear(double v)
{
    return (v <= 0.04045) ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
}

void srgb_to_xyz(uint8_t r, uint8_t g, uint8_t b, double xyz[3])
{
    double rgb[3] = {
        srgb_to_linear(r / 255.0),
        srgb_to_linear(g / 255.0),
        srgb_to_linear(b / 255.0)
    };

    for (int i = 0; i < 3; i++)
    {
        xyz[i] = rgb_to_xyz[i][0] * rgb[0] + rgb_to_xyz[i][1] * rgb[1] + rgb_to_xyz[i][2] * rgb[2];
    }
}

void srgb_to_jzazbz(uint8_t r, uint8_t g, uint8_t b, double luminance, double jab[3])
{
    double xyz[3];
    srgb_to_xyz(r, g, b, xyz);
    for (int i = 0; i < 3; i++) xyz[i] *= luminance;

    // pre-adaptation of X and Y
    double xp = jz_b * xyz[0] - (jz_b - 1.0) * xyz[2];
    double yp = jz_g * xyz[1] - (jz_g - 1.0) * xyz[0];
    double zp = xyz[2];

    double lms[3];
    for (int i = 0; i < 3; i++)
    {
        lms[i] = pq(xyz_to_lms[i][0] * xp + xyz_to_lms[i][1] * yp + xyz_to_lms[i][2] * zp);
    }

    double iab[3];
    for (int i = 0; i < 3; i++)
    {
        iab[i] = lms_to_iab[i][0] * lms[0] + lms_to_iab[i][1] * lms[1] + lms_to_iab[i][2] * lms[2];
    }

    jab[0] = ((1.0 + jz_d) * iab[0]) / (1.0 + jz_d * iab[0]) - jz_d0;
    jab[1] = iab[1];
    jab[2] = iab[2];
}

void srgb_to_lab(uint8_t r, uint8_t g, uint8_t b, double lab[3])
{
    double xyz[3];
    srgb_to_xyz(r, g, b, xyz);

    double fx = lab_f(xyz[0] / d65_white[0]);
    double fy = lab_f(xyz[1] / d65_white[1]);
    double fz = lab_f(xyz[2] / d65_white[2]);

    lab[0] = 116.0 * fy - 16.0;
    lab[1] = 500.0 * (fx - fy);
    lab[2] = 200.0 * (fy - fz);
}

} // namespace colorspace
} // namespace w2cv
