/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>
#include <cmath>

#include "vector_object.hpp"
#include "../io/io.hpp"

namespace w2cv {

namespace {

template <class T>
void check_finite(const std::vector<T>& v, const char* what)
{
    for (size_t i = 0; i < v.size(); i++)
    {
        if (!std::isfinite(v[i])) throw io::format_error(string("non-finite value in ") + what);
    }
}

struct tag_visitor : public boost::static_visitor<vector_tag_t>
{
    vector_tag_t operator()(const FeatureVector&) const { return tag_feature_vector; }
    vector_tag_t operator()(const Colorgram&) const     { return tag_colorgram; }
    vector_tag_t operator()(const WordVector&) const    { return tag_word_vector; }
};

struct write_visitor : public boost::static_visitor<size_t>
{
    explicit write_visitor(std::ostream& os) : _os(os) {}

    template <class T>
    size_t operator()(const T& v) const { return write(_os, v); }

    std::ostream& _os;
};

} // anonymous namespace

vector_tag_t tag_of(const vector_object_t& object)
{
    return boost::apply_visitor(tag_visitor(), object);
}


// ---------------------------------------------------------------------------
// FeatureVector
// ---------------------------------------------------------------------------

size_t write(std::ostream& os, const FeatureVector& v)
{
    size_t s = io::write(os, v.revision);
    s += io::write(os, v.word);
    s += io::write(os, v.image_id);
    s += io::write(os, static_cast<int64_t>(v.timestamp));
    s += io::write(os, v.values);
    return s;
}

size_t read(std::istream& is, FeatureVector& v)
{
    FeatureVector tmp;
    size_t s = io::read(is, tmp.revision);
    s += io::read(is, tmp.word);
    s += io::read(is, tmp.image_id);
    s += io::read(is, tmp.timestamp);
    s += io::read(is, tmp.values);

    check_finite(tmp.values, "feature vector");
    v = tmp;
    return s;
}


// ---------------------------------------------------------------------------
// Colorgram
// ---------------------------------------------------------------------------

size_t write(std::ostream& os, const Colorgram& v)
{
    size_t s = io::write(os, static_cast<int32_t>(v.shape.bins));
    s += io::write(os, static_cast<int32_t>(v.shape.levels));
    s += io::write(os, static_cast<int32_t>(v.shape.grid));
    s += io::write(os, static_cast<int8_t>(v.shape.mode));
    s += io::write(os, v.histograms);
    s += io::write(os, v.means);
    s += io::write(os, v.variances);
    s += io::write(os, v.pixel_counts);
    return s;
}

size_t read(std::istream& is, Colorgram& v)
{
    int32_t bins = 0, levels = 0, grid = 0;
    int8_t mode = 0;

    size_t s = io::read(is, bins);
    s += io::read(is, levels);
    s += io::read(is, grid);
    s += io::read(is, mode);

    // placeholder written for images that could not be processed
    if (bins == 0 && levels == 0 && grid == 0)
    {
        Colorgram tmp;
        s += io::read(is, tmp.histograms);
        s += io::read(is, tmp.means);
        s += io::read(is, tmp.variances);
        s += io::read(is, tmp.pixel_counts);
        if (!tmp.histograms.empty() || !tmp.means.empty() || !tmp.variances.empty() || !tmp.pixel_counts.empty())
        {
            throw io::format_error("empty colorgram with data");
        }
        v = tmp;
        return s;
    }

    if (bins < 1 || levels < 1 || grid < 1) throw io::format_error("invalid colorgram shape");
    if (mode != ColorgramShape::marginal && mode != ColorgramShape::joint)
    {
        throw io::format_error("invalid colorgram mode " + boost::lexical_cast<string>(static_cast<int>(mode)));
    }

    Colorgram tmp;
    tmp.shape = ColorgramShape(bins, levels, grid, static_cast<ColorgramShape::mode_t>(mode));
    if (!tmp.shape.valid()) throw io::format_error("colorgram shape too large");
    s += io::read(is, tmp.histograms);
    s += io::read(is, tmp.means);
    s += io::read(is, tmp.variances);
    s += io::read(is, tmp.pixel_counts);

    if (!tmp.consistent()) throw io::format_error("colorgram arrays do not match its shape");
    check_finite(tmp.histograms, "colorgram histogram");
    check_finite(tmp.means, "colorgram means");
    check_finite(tmp.variances, "colorgram variances");

    v = tmp;
    return s;
}


// ---------------------------------------------------------------------------
// WordVector
// ---------------------------------------------------------------------------

size_t write(std::ostream& os, const WordVector& v)
{
    size_t s = io::write(os, v.word);
    s += io::write(os, v.revision);
    s += io::write(os, static_cast<uint64_t>(v.stats.count()));
    s += io::write(os, v.stats.mean());
    s += io::write(os, v.stats.variance());
    s += io::write(os, v.stats.m2());
    return s;
}

size_t read(std::istream& is, WordVector& v)
{
    string word, revision;
    uint64_t count = 0;
    vec_f64_t mean, variance, m2;

    size_t s = io::read(is, word);
    s += io::read(is, revision);
    s += io::read(is, count);
    s += io::read(is, mean);
    s += io::read(is, variance);
    s += io::read(is, m2);

    if (count == 0) throw io::format_error("word vector (" + word + ", " + revision + ") has count 0");
    if (mean.size() != variance.size() || mean.size() != m2.size())
    {
        throw io::format_error("word vector (" + word + ", " + revision + ") has inconsistent lengths");
    }
    check_finite(mean, "word vector mean");
    check_finite(variance, "word vector variance");
    check_finite(m2, "word vector m2");

    // variance is redundant, it has to agree with m2 / count
    for (size_t i = 0; i < m2.size(); i++)
    {
        double expected = m2[i] / static_cast<double>(count);
        if (m2[i] < 0.0 || std::fabs(variance[i] - expected) > 1e-9 * std::max(1.0, std::fabs(expected)))
        {
            throw io::format_error("word vector (" + word + ", " + revision + ") has inconsistent variance");
        }
    }

    v = WordVector(word, revision, RunningStats(count, mean, m2));
    return s;
}


// ---------------------------------------------------------------------------
// vector_object_t
// ---------------------------------------------------------------------------

size_t write(std::ostream& os, const vector_object_t& v)
{
    size_t s = io::write(os, static_cast<int8_t>(tag_of(v)));
    s += boost::apply_visitor(write_visitor(os), v);
    return s;
}

size_t read(std::istream& is, vector_object_t& v)
{
    int8_t tag = 0;
    size_t s = io::read(is, tag);

    switch (tag)
    {
        case tag_feature_vector:
        {
            FeatureVector fv;
            s += read(is, fv);
            v = fv;
            break;
        }
        case tag_colorgram:
        {
            Colorgram cg;
            s += read(is, cg);
            v = cg;
            break;
        }
        case tag_word_vector:
        {
            WordVector wv;
            s += read(is, wv);
            v = wv;
            break;
        }
        default:
            throw io::format_error("unknown record tag " + boost::lexical_cast<string>(static_cast<int>(tag)));
    }

    return s;
}

} // namespace w2cv
