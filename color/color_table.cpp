/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <cmath>
#include <limits>
#include <stdexcept>

#include "color_table.hpp"
#include "color_spaces.hpp"
#include "../io/property_reader.hpp"
#include "../io/property_writer.hpp"
#include "../util/errors.hpp"

namespace w2cv {

const size_t LookupColorTable::num_colors;

LookupColorTable::LookupColorTable(const string& name, vec_f32_t& data)
    : _name(name)
{
    if (data.size() != 3 * num_colors)
    {
        throw MissingColorTable("color table '" + name + "' holds " + boost::lexical_cast<string>(data.size())
                                + " values, expected " + boost::lexical_cast<string>(3 * num_colors));
    }

    for (int c = 0; c < 3; c++)
    {
        _min[c] = std::numeric_limits<float>::max();
        _max[c] = -std::numeric_limits<float>::max();
    }

    for (size_t i = 0; i < data.size(); i++)
    {
        float v = data[i];
        if (!std::isfinite(v))
        {
            throw MissingColorTable("color table '" + name + "' contains non-finite value at index "
                                    + boost::lexical_cast<string>(i));
        }
        int c = i % 3;
        if (v < _min[c]) _min[c] = v;
        if (v > _max[c]) _max[c] = v;
    }

    _data.swap(data);
}

shared_ptr<LookupColorTable> LookupColorTable::load(const string& filename)
{
    vec_f32_t data;
    string name;

    try
    {
        PropertyReaderT<vec_f32_t> reader(filename);
        if (reader.size() != 1)
        {
            throw std::runtime_error("expected a single table element, found " + boost::lexical_cast<string>(reader.size()));
        }
        data = reader[0];
        name = reader.entry("colorspace").get_value_or(string("unknown"));
    }
    catch (const std::exception& e)
    {
        throw MissingColorTable("cannot load color table from " + filename + ": " + e.what());
    }

    return make_shared<LookupColorTable>(name, data);
}

shared_ptr<LookupColorTable> LookupColorTable::generate(const string& colorspace, double luminance)
{
    if (colorspace != "jzazbz" && colorspace != "lab")
    {
        throw std::invalid_argument("unknown colorspace: " + colorspace);
    }

    vec_f32_t data(3 * num_colors);
    bool jzazbz = (colorspace == "jzazbz");

    #pragma omp parallel for
    for (int r = 0; r < 256; r++)
    {
        double v[3];
        for (int g = 0; g < 256; g++)
        for (int b = 0; b < 256; b++)
        {
            if (jzazbz) colorspace::srgb_to_jzazbz(r, g, b, luminance, v);
            else        colorspace::srgb_to_lab(r, g, b, v);

            float* p = &data[3 * ((r << 16) | (g << 8) | b)];
            p[0] = static_cast<float>(v[0]);
            p[1] = static_cast<float>(v[1]);
            p[2] = static_cast<float>(v[2]);
        }
    }

    return make_shared<LookupColorTable>(colorspace, data);
}

void LookupColorTable::save(const string& filename) const
{
    PropertyWriterT<vec_f32_t> writer(filename);
    writer.set_entry("colorspace", _name);
    writer.push_back_value(_data);
    writer.close();
}

} // namespace w2cv
