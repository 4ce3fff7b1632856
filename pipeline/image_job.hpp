/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef PIPELINE__IMAGE_JOB_HPP
#define PIPELINE__IMAGE_JOB_HPP

#include "../util/types.hpp"
#include "../descriptors/feature_vector.hpp"

namespace w2cv {

/**
 * @ingroup pipeline
 * @brief One image of a batch together with the word it is labeled with.
 *
 * load is called on a worker thread and returns the decoded image in BGR order. An
 * empty matrix or a cv::Exception means the image could not be decoded.
 */
struct ImageJob
{
    ImageJob() {}
    ImageJob(const string& image_id_, const string& word_, const function<cv::Mat ()>& load_)
        : image_id(image_id_), word(word_), load(load_)
    {}

    string                  image_id;
    string                  word;
    function<cv::Mat ()>    load;
};

/// Job that decodes filename with cv::imread
ImageJob make_file_job(const string& filename, const string& image_id, const string& word);


/**
 * @ingroup pipeline
 * @brief Outcome of a single ImageJob.
 */
struct ImageResult
{
    enum status_t
    {
        pending,    ///< not processed, e.g. because the batch has been cancelled
        succeeded,
        failed
    };

    ImageResult() : status(pending) {}

    string        image_id;
    string        word;
    status_t      status;
    string        error;    ///< reason of the failure if status == failed
    FeatureVector vector;   ///< valid if status == succeeded
};

} // namespace w2cv

#endif // PIPELINE__IMAGE_JOB_HPP
