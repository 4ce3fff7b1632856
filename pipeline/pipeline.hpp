/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef PIPELINE__PIPELINE_HPP
#define PIPELINE__PIPELINE_HPP

#include "../util/types.hpp"
#include "../color/converter.hpp"
#include "../descriptors/colorgram.hpp"
#include "../descriptors/feature_extractor.hpp"
#include "../descriptors/feature_vector.hpp"
#include "resources.hpp"
#include "image_job.hpp"

namespace w2cv {

class VectorStore;

/**
 * @ingroup pipeline
 * @brief Image to feature vector: color conversion, colorgram and feature extraction.
 *
 * All parameters are read from the ptree passed to the constructor, missing ones are
 * set to their defaults, see parameters(). A Pipeline is immutable after construction,
 * process() can be called from any number of threads at the same time.
 */
class Pipeline
{
    public:

    /**
     * @throws MissingColorTable if resources.color_table is null
     * @throws MissingTransform, DimensionMismatch, std::invalid_argument for an invalid configuration
     */
    Pipeline(const ptree& params, const PipelineResources& resources);

    /**
     * @brief Computes the feature vector of a single image.
     *
     * The result is labeled with word and the configured revision and stamped with the
     * current time.
     *
     * @throws InvalidPixelRange if image is not a valid 3-channel image
     */
    FeatureVector process(const cv::Mat& image, const string& image_id, const string& word) const;

    /// Same as above, additionally returns the intermediate colorgram
    FeatureVector process(const cv::Mat& image, const string& image_id, const string& word, Colorgram& colorgram) const;

    /// @throws InvalidPixelRange if image is not a valid 3-channel image
    Colorgram colorgram(const cv::Mat& image) const;

    /// Feature vector of a colorgram as computed by colorgram()
    vec_f32_t features(const Colorgram& colorgram) const;

    /**
     * @brief Processes a whole batch on num_threads threads, see BatchRunner.
     *
     * Results are in the order of jobs.
     *
     * @throws std::runtime_error if the batch had to be aborted
     */
    vector<ImageResult> run(const vector<ImageJob>& jobs, int num_threads, VectorStore& store) const;

    size_t feature_length() const { return _extractor.length(); }
    const string& revision() const { return _revision; }

    /// Effective parameters including all defaults
    const ptree& parameters() const { return _parameters; }

    private:

    ColorConverter     _converter;
    ColorgramGenerator _generator;
    FeatureExtractor   _extractor;
    ptree              _parameters;
    string             _revision;
};

} // namespace w2cv

#endif // PIPELINE__PIPELINE_HPP
