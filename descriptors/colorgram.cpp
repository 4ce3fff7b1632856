/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>
#include <stdexcept>

#include "colorgram.hpp"
#include "../util/errors.hpp"
#include "../util/running_stats.hpp"

namespace w2cv {

// ---------------------------------------------------------------------------
// ColorgramShape
// ---------------------------------------------------------------------------

ColorgramShape::ColorgramShape()
    : bins(0), levels(0), grid(0), mode(marginal)
{}

ColorgramShape::ColorgramShape(size_t bins_, size_t levels_, size_t grid_, mode_t mode_)
    : bins(bins_), levels(levels_), grid(grid_), mode(mode_)
{}

size_t ColorgramShape::resolution(size_t level) const
{
    size_t res = 1;
    for (size_t i = 0; i < level; i++) res *= grid;
    return res;
}

size_t ColorgramShape::level_offset(size_t level) const
{
    size_t offset = 0;
    for (size_t i = 0; i < level; i++) offset += resolution(i) * resolution(i);
    return offset;
}

size_t ColorgramShape::num_cells() const
{
    return level_offset(levels);
}

size_t ColorgramShape::histogram_size() const
{
    return (mode == joint) ? bins * bins * bins : 3 * bins;
}

bool ColorgramShape::valid() const
{
    const double max_values = double(size_t(1) << 26);

    if (bins < 1 || levels < 1 || grid < 1) return false;

    const double h = (mode == joint) ? double(bins) * bins * bins : 3.0 * bins;
    if (h > max_values) return false;

    // cells grow with every level, stop as soon as the limit is crossed
    double cells = 0;
    double level_cells = 1;
    for (size_t l = 0; l < levels; l++)
    {
        cells += level_cells;
        if (cells * h > max_values) return false;
        level_cells *= double(grid) * grid;
    }
    return true;
}

bool ColorgramShape::operator==(const ColorgramShape& other) const
{
    return bins == other.bins && levels == other.levels && grid == other.grid && mode == other.mode;
}


// ---------------------------------------------------------------------------
// Colorgram
// ---------------------------------------------------------------------------

Colorgram::Colorgram(const ColorgramShape& s)
    : shape(s)
    , histograms(s.num_cells() * s.histogram_size(), 0.0f)
    , means(s.num_cells() * 3, 0.0f)
    , variances(s.num_cells() * 3, 0.0f)
    , pixel_counts(s.num_cells(), 0)
{}

bool Colorgram::consistent() const
{
    size_t cells = shape.num_cells();
    return histograms.size() == cells * shape.histogram_size()
        && means.size() == cells * 3
        && variances.size() == cells * 3
        && pixel_counts.size() == cells;
}


// ---------------------------------------------------------------------------
// ColorgramGenerator
// ---------------------------------------------------------------------------

ColorgramGenerator::ColorgramGenerator(const ptree& params, const ColorTable& table)
    : _parameters(params)
{
    int bins   = parse<int>   (_parameters, "colorgram.bins"  , 8         ); // bins per channel
    int levels = parse<int>   (_parameters, "colorgram.levels", 1         ); // spatial pyramid levels
    int grid   = parse<int>   (_parameters, "colorgram.grid"  , 2         ); // cells per side, per level
    string mode= parse<string>(_parameters, "colorgram.mode"  , "marginal"); // marginal or joint

    if (bins < 1)   throw std::invalid_argument("colorgram.bins must be > 0");
    if (levels < 1) throw std::invalid_argument("colorgram.levels must be > 0");
    if (grid < 1)   throw std::invalid_argument("colorgram.grid must be > 0");
    if (mode != "marginal" && mode != "joint")
    {
        throw std::invalid_argument("colorgram.mode must be 'marginal' or 'joint', got '" + mode + "'");
    }

    _shape = ColorgramShape(bins, levels, grid, mode == "joint" ? ColorgramShape::joint : ColorgramShape::marginal);
    if (!_shape.valid())
    {
        throw std::invalid_argument("colorgram.bins, colorgram.levels and colorgram.grid give too many histogram values");
    }

    for (int c = 0; c < 3; c++)
    {
        string prefix = "colorgram.range.c" + boost::lexical_cast<string>(c);
        double lo = parse<float>(_parameters, prefix + ".min", table.channel_min(c));
        double hi = parse<float>(_parameters, prefix + ".max", table.channel_max(c));
        if (!(hi > lo)) throw std::invalid_argument(prefix + ": max must be larger than min");

        _edges[c].resize(bins + 1);
        for (int k = 0; k <= bins; k++) _edges[c][k] = lo + k * (hi - lo) / bins;
    }
}

size_t ColorgramGenerator::bin(int c, float v) const
{
    // first interior edge >= v: a value on an edge stays in the lower bin
    const vec_f64_t& e = _edges[c];
    return std::lower_bound(e.begin() + 1, e.end() - 1, static_cast<double>(v)) - (e.begin() + 1);
}

Colorgram ColorgramGenerator::compute(const mat_32fc3_t& image) const
{
    if (image.empty()) throw InvalidPixelRange("cannot compute colorgram of an empty image");

    const size_t bins  = _shape.bins;
    const size_t hsize = _shape.histogram_size();
    const size_t cells = _shape.num_cells();
    const size_t cols  = image.cols;
    const size_t rows  = image.rows;

    vector<size_t> res(_shape.levels);
    vector<size_t> offset(_shape.levels);
    for (size_t l = 0; l < _shape.levels; l++)
    {
        res[l] = _shape.resolution(l);
        offset[l] = _shape.level_offset(l);
    }

    // accumulate in double, float is exact only up to 2^24 pixels
    vec_f64_t counts(cells * hsize, 0.0);
    vector<RunningStats> stats(cells, RunningStats(3));

    for (size_t y = 0; y < rows; y++)
    {
        const cv::Vec3f* row = image[y];
        for (size_t x = 0; x < cols; x++)
        {
            const cv::Vec3f& v = row[x];
            size_t b0 = bin(0, v[0]);
            size_t b1 = bin(1, v[1]);
            size_t b2 = bin(2, v[2]);
            double sample[3] = { v[0], v[1], v[2] };

            for (size_t l = 0; l < _shape.levels; l++)
            {
                size_t cx = x * res[l] / cols;
                size_t cy = y * res[l] / rows;
                size_t cell = offset[l] + cy * res[l] + cx;

                double* h = &counts[cell * hsize];
                if (_shape.mode == ColorgramShape::joint)
                {
                    h[(b0 * bins + b1) * bins + b2] += 1.0;
                }
                else
                {
                    h[b0] += 1.0;
                    h[bins + b1] += 1.0;
                    h[2 * bins + b2] += 1.0;
                }

                stats[cell].add(sample);
            }
        }
    }

    Colorgram result(_shape);
    for (size_t cell = 0; cell < cells; cell++)
    {
        uint64_t n = stats[cell].count();
        result.pixel_counts[cell] = static_cast<uint32_t>(n);
        if (n == 0) continue;

        // every pixel adds one to each channel histogram (marginal) or
        // one to the joint histogram, so dividing by n normalizes either
        for (size_t i = 0; i < hsize; i++)
        {
            result.histograms[cell * hsize + i] = static_cast<float>(counts[cell * hsize + i] / n);
        }

        vec_f64_t var = stats[cell].variance();
        for (int c = 0; c < 3; c++)
        {
            result.means[cell * 3 + c] = static_cast<float>(stats[cell].mean()[c]);
            result.variances[cell * 3 + c] = static_cast<float>(var[c]);
        }
    }

    return result;
}

} // namespace w2cv
