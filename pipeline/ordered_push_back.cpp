/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <stdexcept>

#include "ordered_push_back.hpp"

namespace w2cv {

OrderedPushBack::OrderedPushBack(shared_ptr<PropertyWriter> writer)
    : _writer(writer)
    , _num_written(0)
{}

void OrderedPushBack::push_back(size_t index, const boost::any& element)
{
    boost::lock_guard<boost::mutex> locked(_mutex);

    if (index < _num_written)
    {
        throw std::logic_error("OrderedPushBack: element " + boost::lexical_cast<string>(index) + " written twice");
    }

    _queue.push(queue_element(index, make_shared<boost::any>(element)));

    // write the leading run of consecutive indices
    while (!_queue.empty() && _queue.top().first == _num_written)
    {
        _writer->push_back(*_queue.top().second);
        _queue.pop();
        _num_written++;
    }
}

bool OrderedPushBack::empty_buffer() const
{
    boost::lock_guard<boost::mutex> locked(_mutex);
    return _queue.empty();
}

size_t OrderedPushBack::num_written() const
{
    boost::lock_guard<boost::mutex> locked(_mutex);
    return _num_written;
}

} // namespace w2cv
