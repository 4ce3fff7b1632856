/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef COLOR__COLOR_TABLE_HPP
#define COLOR__COLOR_TABLE_HPP

#include "../util/types.hpp"

namespace w2cv {

/**
 * @ingroup color
 * @brief Interface for a mapping from 8-bit device RGB to a 3-channel perceptual color space.
 *
 * A ColorTable is loaded once at startup and shared read-only by all worker threads,
 * implementations must therefore be safe to use concurrently through the const interface.
 */
class ColorTable
{
    public:

    virtual ~ColorTable() {}

    /// Perceptual triple for the device RGB triple (r, g, b)
    virtual cv::Vec3f lookup(uint8_t r, uint8_t g, uint8_t b) const = 0;

    /// Smallest value channel c takes over the whole RGB domain
    virtual float channel_min(int c) const = 0;

    /// Largest value channel c takes over the whole RGB domain
    virtual float channel_max(int c) const = 0;

    /// Name of the target color space, e.g. "jzazbz"
    virtual const string& name() const = 0;
};


/**
 * @ingroup color
 * @brief ColorTable backed by a precomputed array covering all 256^3 RGB triples.
 *
 * Entry (r,g,b) is stored at index ((r*256)+g)*256+b as three consecutive floats. The
 * table is stored on disk as a property file holding a single vec_f32_t element and a
 * "colorspace" entry, see save() and load().
 */
class LookupColorTable : public ColorTable
{
    public:

    static const size_t num_colors = 256 * 256 * 256;

    /**
     * @brief Takes over the content of data, which is left empty.
     * @throws MissingColorTable if data does not hold 3*num_colors finite values
     */
    LookupColorTable(const string& name, vec_f32_t& data);

    /**
     * @brief Loads a table written by save().
     * @throws MissingColorTable if the file is absent, unreadable or does not hold a valid table
     */
    static shared_ptr<LookupColorTable> load(const string& filename);

    /**
     * @brief Computes the table for all 256^3 sRGB triples.
     * @param colorspace "jzazbz" or "lab"
     * @param luminance luminance of sRGB white in cd/m^2, only used for "jzazbz"
     * @throws std::invalid_argument for an unknown colorspace
     */
    static shared_ptr<LookupColorTable> generate(const string& colorspace, double luminance = 100.0);

    void save(const string& filename) const;

    cv::Vec3f lookup(uint8_t r, uint8_t g, uint8_t b) const
    {
        const float* p = &_data[3 * ((static_cast<size_t>(r) << 16) | (static_cast<size_t>(g) << 8) | b)];
        return cv::Vec3f(p[0], p[1], p[2]);
    }

    float channel_min(int c) const { return _min[c]; }
    float channel_max(int c) const { return _max[c]; }
    const string& name() const { return _name; }

    private:

    string    _name;
    vec_f32_t _data;
    float     _min[3];
    float     _max[3];
};

} // namespace w2cv

#endif // COLOR__COLOR_TABLE_HPP
