/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef PIPELINE__BATCH_RUNNER_HPP
#define PIPELINE__BATCH_RUNNER_HPP

#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>

#include <QDateTime>

#include "../util/types.hpp"
#include "../io/property_writer.hpp"
#include "../aggregate/aggregator.hpp"
#include "pipeline.hpp"
#include "image_job.hpp"
#include "ordered_push_back.hpp"

namespace w2cv {

class VectorStore;

/**
 * @ingroup pipeline
 * @brief Runs a batch of images through a Pipeline on a pool of worker threads.
 *
 * Every successfully computed feature vector is put into the store and contributed to
 * the word vector of (word, revision) as soon as it is available. Images that cannot be
 * decoded, contain invalid pixel values or are already part of (word, revision) are
 * reported as failed results, all other errors abort the whole batch.
 *
 * cancel() may be called from any thread while start() is running. Jobs already
 * dispatched are completed, all others stay pending.
 */
class BatchRunner : boost::noncopyable
{
    public:

    BatchRunner(const Pipeline& pipeline, const vector<ImageJob>& jobs, VectorStore& store);

    /// Writes the colorgram of every job, in job order, to writer. Failed jobs get an empty colorgram.
    void add_colorgram_writer(shared_ptr<PropertyWriter> writer);

    /**
     * @brief Processes all jobs, returns once all worker threads have finished.
     * @return false if the batch has been aborted, see error()
     * @throws std::invalid_argument if num_threads < 1
     */
    bool start(int num_threads);

    void cancel();
    bool cancelled() const;

    /// Number of jobs dispatched so far
    size_t current() const;
    bool finished() const;

    index_t num_jobs() const;
    size_t num_failed() const;

    /// Seconds spent in start(), precondition: finished() == true
    int computation_time() const;

    /// Reason the batch has been aborted, empty if it has not
    string error() const;

    /// One result per job, in the order of the jobs
    const vector<ImageResult>& results() const { return _results; }

    private:

    void _thread();
    void _process(size_t index);
    void _abort(const string& message);

    const Pipeline&                _pipeline;
    vector<ImageJob>               _jobs;
    Aggregator                     _aggregator;
    shared_ptr<OrderedPushBack>    _colorgrams;
    vector<ImageResult>            _results;

    size_t _index;
    size_t _failed;
    bool   _error;
    bool   _cancelled;
    bool   _started;
    bool   _finished;
    string _error_message;

    QDateTime _datetime;
    int       _seconds;

    mutable boost::mutex _mutex;
};

} // namespace w2cv

#endif // PIPELINE__BATCH_RUNNER_HPP
