/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <boost/bind.hpp>

#include "aggregator.hpp"
#include "../store/vector_store.hpp"
#include "../util/errors.hpp"

namespace w2cv {

Aggregator::Aggregator(VectorStore& store)
    : _store(store)
{}

void Aggregator::_add(RunningStats& stats, const vec_f32_t& values)
{
    stats.add(values);
}

WordVector Aggregator::contribute(const string& word, const string& revision, const FeatureVector& v)
{
    if (v.values.empty()) throw DimensionMismatch("cannot contribute an empty feature vector to '" + word + "'");

    return _store.modify(word, revision, boost::bind(&Aggregator::_add, boost::arg<1>(), boost::cref(v.values)));
}

WordVector Aggregator::contribute(const FeatureVector& v)
{
    return contribute(v.word, v.revision, v);
}

WordVector Aggregator::add_image(const FeatureVector& v)
{
    if (v.values.empty()) throw DimensionMismatch("cannot contribute an empty feature vector to '" + v.word + "'");

    return _store.add(v, boost::bind(&Aggregator::_add, boost::arg<1>(), boost::cref(v.values)));
}

WordVector Aggregator::merge(const WordVector& a, const WordVector& b)
{
    return w2cv::merge(a, b);
}

} // namespace w2cv
