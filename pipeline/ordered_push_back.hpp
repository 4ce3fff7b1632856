/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef PIPELINE__ORDERED_PUSH_BACK_HPP
#define PIPELINE__ORDERED_PUSH_BACK_HPP

#include <queue>

#include <boost/thread/mutex.hpp>

#include "../util/types.hpp"
#include "../io/property_writer.hpp"

namespace w2cv {

/**
 * @ingroup pipeline
 * @brief Writes elements that arrive in arbitrary order in the order of their index.
 *
 * Worker threads finish their jobs out of order. Elements are buffered until all
 * elements with a smaller index have been written, such that element i of the
 * property file always belongs to job i.
 */
class OrderedPushBack
{
    public:

    explicit OrderedPushBack(shared_ptr<PropertyWriter> writer);

    /// @throws std::logic_error if index has already been written
    void push_back(size_t index, const boost::any& element);

    bool empty_buffer() const;

    /// Number of elements written to the underlying writer so far
    size_t num_written() const;

    private:

    typedef std::pair<size_t, shared_ptr<boost::any> > queue_element;

    struct queue_compare
    {
        bool operator()(const queue_element& a, const queue_element& b) const { return a.first > b.first; }
    };

    typedef std::priority_queue<queue_element, std::vector<queue_element>, queue_compare> queue_t;

    shared_ptr<PropertyWriter> _writer;
    size_t                     _num_written;
    queue_t                    _queue;
    mutable boost::mutex       _mutex;
};

} // namespace w2cv

#endif // PIPELINE__ORDERED_PUSH_BACK_HPP
