/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef DESCRIPTORS__COLORGRAM_HPP
#define DESCRIPTORS__COLORGRAM_HPP

#include "../util/types.hpp"
#include "../color/color_table.hpp"

namespace w2cv {

/**
 * @ingroup descriptors
 * @brief Layout of a Colorgram: histogram type, bin count and spatial pyramid.
 *
 * Level l of the pyramid partitions the image into a res x res grid of cells with
 * res = grid^l, level 0 always being a single cell covering the whole image. Cells
 * are numbered level by level, row-major within a level.
 */
struct ColorgramShape
{
    enum mode_t
    {
        marginal = 0,   ///< one histogram per channel, 3*bins values per cell
        joint    = 1    ///< one 3D histogram, bins^3 values per cell
    };

    ColorgramShape();
    ColorgramShape(size_t bins, size_t levels, size_t grid, mode_t mode);

    /// Number of cells on one side of the grid at the given level
    size_t resolution(size_t level) const;

    /// Index of the first cell of the given level
    size_t level_offset(size_t level) const;

    size_t num_cells() const;
    size_t histogram_size() const;

    /// True if all parameters are > 0 and num_cells() * histogram_size() stays below
    /// 2^26, evaluated without overflowing size_t
    bool valid() const;

    bool operator==(const ColorgramShape& other) const;
    bool operator!=(const ColorgramShape& other) const { return !(*this == other); }

    size_t bins;
    size_t levels;
    size_t grid;
    mode_t mode;
};


/**
 * @ingroup descriptors
 * @brief Histogram digest of the color distribution of one image in perceptual space.
 *
 * For every cell we store a normalized histogram (each channel histogram sums to 1 in
 * marginal mode, the 3D histogram sums to 1 in joint mode), the mean and variance of
 * the three channels and the number of pixels. Cells without any pixel (only possible
 * when the image is smaller than the grid) are all zero.
 */
struct Colorgram
{
    Colorgram() {}
    explicit Colorgram(const ColorgramShape& s);

    const float* histogram(size_t cell) const { return &histograms[cell * shape.histogram_size()]; }

    /// True if all arrays have the sizes mandated by shape
    bool consistent() const;

    ColorgramShape shape;
    vec_f32_t      histograms;    ///< num_cells() x histogram_size()
    vec_f32_t      means;         ///< num_cells() x 3
    vec_f32_t      variances;     ///< num_cells() x 3
    vec_u32_t      pixel_counts;  ///< num_cells()
};


/**
 * @ingroup descriptors
 * @brief Computes the Colorgram of a perceptual image.
 *
 * Parameters (ptree paths, default in brackets):
 * - colorgram.bins [8]: number of bins per channel
 * - colorgram.levels [1]: number of pyramid levels
 * - colorgram.grid [2]: subdivision factor between levels, 2 gives quadrants
 * - colorgram.mode [marginal]: "marginal" or "joint"
 * - colorgram.range.c{0,1,2}.{min,max} [range of the color table]: histogram range per channel
 *
 * Bins are equally spaced over [min, max]. A value exactly on the boundary between two
 * bins is counted in the lower one, values outside of the range go to the first or last bin.
 */
class ColorgramGenerator
{
    public:

    /// @throws std::invalid_argument for invalid parameter values
    ColorgramGenerator(const ptree& params, const ColorTable& table);

    /// @throws InvalidPixelRange if image is empty
    Colorgram compute(const mat_32fc3_t& image) const;

    /// Index of the bin value v of channel c falls into
    size_t bin(int c, float v) const;

    const ColorgramShape& shape() const { return _shape; }

    /// bins+1 boundaries of channel c, from range min to range max
    const vec_f64_t& bin_edges(int c) const { return _edges[c]; }

    /// The parameters actually used, including defaults
    const ptree& parameters() const { return _parameters; }

    private:

    ptree          _parameters;
    ColorgramShape _shape;
    vec_f64_t      _edges[3];
};

} // namespace w2cv

#endif // DESCRIPTORS__COLORGRAM_HPP
