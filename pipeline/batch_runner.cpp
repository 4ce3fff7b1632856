/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <iostream>
#include <stdexcept>

#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>

#include "batch_runner.hpp"
#include "../store/vector_object.hpp"
#include "../util/errors.hpp"

namespace w2cv {

BatchRunner::BatchRunner(const Pipeline& pipeline, const vector<ImageJob>& jobs, VectorStore& store)
    : _pipeline(pipeline)
    , _jobs(jobs)
    , _aggregator(store)
    , _results(jobs.size())
    , _index(0)
    , _failed(0)
    , _error(false)
    , _cancelled(false)
    , _started(false)
    , _finished(false)
    , _seconds(0)
{
    for (size_t i = 0; i < _jobs.size(); i++)
    {
        _results[i].image_id = _jobs[i].image_id;
        _results[i].word = _jobs[i].word;
    }
}

void BatchRunner::add_colorgram_writer(shared_ptr<PropertyWriter> writer)
{
    _colorgrams = make_shared<OrderedPushBack>(writer);
}

bool BatchRunner::start(int num_threads)
{
    if (num_threads < 1) throw std::invalid_argument("number of threads must be > 0");

    {
        boost::lock_guard<boost::mutex> lock(_mutex);
        if (_started) return false;
        _started = true;
    }

    _datetime = QDateTime::currentDateTime();

    boost::thread_group pool;
    for (int i = 0; i < num_threads; i++)
    {
        pool.create_thread(boost::bind(&BatchRunner::_thread, this));
    }

    pool.join_all();

    boost::lock_guard<boost::mutex> lock(_mutex);
    _finished = true;
    _seconds = _datetime.secsTo(QDateTime::currentDateTime());

    if (_colorgrams && !_error && !_colorgrams->empty_buffer())
    {
        _error = true;
        _error_message = "not all colorgrams have been written";
    }

    return !_error;
}

void BatchRunner::cancel()
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    _cancelled = true;
}

bool BatchRunner::cancelled() const
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _cancelled;
}

size_t BatchRunner::current() const
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _index;
}

bool BatchRunner::finished() const
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _finished;
}

index_t BatchRunner::num_jobs() const
{
    return _jobs.size();
}

size_t BatchRunner::num_failed() const
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _failed;
}

int BatchRunner::computation_time() const
{
    // precondition: finished() == true
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _seconds;
}

string BatchRunner::error() const
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    return _error_message;
}

void BatchRunner::_abort(const string& message)
{
    boost::lock_guard<boost::mutex> lock(_mutex);
    if (!_error) _error_message = message;
    _error = true;
}

void BatchRunner::_thread()
{
    for (;;)
    {
        size_t current;

        {
            boost::lock_guard<boost::mutex> lock(_mutex);
            if (_error || _cancelled || _index == _jobs.size()) break;
            current = _index;
            _index++;
        }

        try
        {
            _process(current);
        }
        catch (const std::exception& e)
        {
            _abort(_jobs[current].image_id + ": " + e.what());
            return;
        }
    }
}

void BatchRunner::_process(size_t index)
{
    const ImageJob& job = _jobs[index];
    ImageResult& result = _results[index];

    Colorgram colorgram;
    FeatureVector v;
    string failure;

    try
    {
        cv::Mat image = job.load();
        if (image.empty()) throw InvalidPixelRange("could not decode image");
        v = _pipeline.process(image, job.image_id, job.word, colorgram);
    }
    catch (const InvalidPixelRange& e)
    {
        failure = e.what();
    }
    catch (const cv::Exception& e)
    {
        // the original opencv message is very verbose, the first line is enough
        failure = "decoding failed: " + e.msg.substr(0, e.msg.find('\n'));
    }

    if (failure.empty())
    {
        try
        {
            _aggregator.add_image(v);
        }
        catch (const DuplicateImage& e)
        {
            failure = e.what();
        }
    }

    if (!failure.empty())
    {
        std::cerr << "w2cv: skipping " << job.image_id << ": " << failure << std::endl;

        result.status = ImageResult::failed;
        result.error = failure;

        {
            boost::lock_guard<boost::mutex> lock(_mutex);
            _failed++;
        }

        if (_colorgrams) _colorgrams->push_back(index, Colorgram());
        return;
    }

    result.vector = v;
    result.status = ImageResult::succeeded;

    if (_colorgrams) _colorgrams->push_back(index, colorgram);
}

} // namespace w2cv
