/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <stdexcept>

#include <boost/bind.hpp>

#include <QDateTime>

#include <opencv2/highgui/highgui.hpp>

#include "pipeline.hpp"
#include "batch_runner.hpp"
#include "../util/errors.hpp"

namespace w2cv {

namespace {

cv::Mat read_image(const string& filename)
{
    // flags > 0 forces a 3-channel image, channel order is BGR
    return cv::imread(filename, 1);
}

} // anonymous namespace

ImageJob make_file_job(const string& filename, const string& image_id, const string& word)
{
    return ImageJob(image_id, word, boost::bind(read_image, filename));
}


Pipeline::Pipeline(const ptree& params, const PipelineResources& resources)
    : _converter(resources.color_table)
    , _generator(params, *resources.color_table)
    , _extractor(_generator.parameters(), _generator.shape(), resources.transform)
    , _parameters(_extractor.parameters())
{
    _revision = parse<string>(_parameters, "store.revision", "unnamed-revision");
    if (_revision.empty()) throw std::invalid_argument("store.revision must not be empty");
}

Colorgram Pipeline::colorgram(const cv::Mat& image) const
{
    return _generator.compute(_converter.convert(image));
}

vec_f32_t Pipeline::features(const Colorgram& colorgram) const
{
    return _extractor.compute(colorgram);
}

FeatureVector Pipeline::process(const cv::Mat& image, const string& image_id, const string& word) const
{
    Colorgram c;
    return process(image, image_id, word, c);
}

FeatureVector Pipeline::process(const cv::Mat& image, const string& image_id, const string& word, Colorgram& c) const
{
    c = colorgram(image);

    FeatureVector v;
    v.values = features(c);
    v.image_id = image_id;
    v.word = word;
    v.revision = _revision;
    v.timestamp = QDateTime::currentMSecsSinceEpoch();
    return v;
}

vector<ImageResult> Pipeline::run(const vector<ImageJob>& jobs, int num_threads, VectorStore& store) const
{
    BatchRunner runner(*this, jobs, store);
    if (!runner.start(num_threads))
    {
        throw std::runtime_error("batch aborted: " + runner.error());
    }
    return runner.results();
}

} // namespace w2cv
