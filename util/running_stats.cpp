/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include "running_stats.hpp"
#include "errors.hpp"

namespace w2cv {

RunningStats::RunningStats()
    : _count(0)
{}

RunningStats::RunningStats(size_t dim)
    : _count(0)
    , _mean(dim, 0.0)
    , _m2(dim, 0.0)
{}

RunningStats::RunningStats(uint64_t count, const vec_f64_t& mean, const vec_f64_t& m2)
    : _count(count)
    , _mean(mean)
    , _m2(m2)
{
    if (mean.size() != m2.size())
    {
        throw DimensionMismatch("mean has length " + boost::lexical_cast<string>(mean.size())
                                + " but m2 has length " + boost::lexical_cast<string>(m2.size()));
    }
}

void RunningStats::add(const vec_f32_t& sample)
{
    if (_count == 0 && _mean.empty())
    {
        _mean.assign(sample.size(), 0.0);
        _m2.assign(sample.size(), 0.0);
    }

    if (sample.size() != _mean.size())
    {
        throw DimensionMismatch("sample has length " + boost::lexical_cast<string>(sample.size())
                                + ", expected " + boost::lexical_cast<string>(_mean.size()));
    }

    _count++;
    double n = static_cast<double>(_count);
    for (size_t i = 0; i < sample.size(); i++)
    {
        double x = sample[i];
        double delta = x - _mean[i];
        _mean[i] += delta / n;
        _m2[i] += delta * (x - _mean[i]);
    }
}

void RunningStats::add(const double* sample)
{
    _count++;
    double n = static_cast<double>(_count);
    for (size_t i = 0; i < _mean.size(); i++)
    {
        double delta = sample[i] - _mean[i];
        _mean[i] += delta / n;
        _m2[i] += delta * (sample[i] - _mean[i]);
    }
}

RunningStats RunningStats::merge(const RunningStats& a, const RunningStats& b)
{
    if (a._count == 0) return b;
    if (b._count == 0) return a;

    if (a.dim() != b.dim())
    {
        throw DimensionMismatch("cannot merge statistics of length " + boost::lexical_cast<string>(a.dim())
                                + " and " + boost::lexical_cast<string>(b.dim()));
    }

    RunningStats result(a.dim());
    result._count = a._count + b._count;

    double na = static_cast<double>(a._count);
    double nb = static_cast<double>(b._count);
    double n  = static_cast<double>(result._count);

    // weighted sum instead of a + delta*nb/n keeps merge(a,b) == merge(b,a) bitwise
    for (size_t i = 0; i < result.dim(); i++)
    {
        double delta = b._mean[i] - a._mean[i];
        result._mean[i] = (na * a._mean[i] + nb * b._mean[i]) / n;
        result._m2[i] = a._m2[i] + b._m2[i] + delta * delta * (na * nb / n);
    }

    return result;
}

vec_f64_t RunningStats::variance() const
{
    vec_f64_t v(_m2.size(), 0.0);
    if (_count == 0) return v;

    double n = static_cast<double>(_count);
    for (size_t i = 0; i < v.size(); i++) v[i] = _m2[i] / n;
    return v;
}

} // namespace w2cv
