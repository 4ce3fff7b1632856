/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef UTIL__PROGRESS_HPP
#define UTIL__PROGRESS_HPP

#include <iostream>
#include <string>

namespace w2cv {

/**
 * @ingroup util
 * @brief Single-line progress output of our command-line tools.
 *
 * The line is rewritten in place every interval elements.
 */
struct progress_output
{
    explicit progress_output(int interval = 1000, std::ostream& os = std::cout)
        : _interval(interval), _os(os)
    {}

    /**
     * @brief Prints "prefix current of total (percent)".
     * @param current index of the element just processed, in [0,total)
     */
    void operator() (int current, int total, const std::string& prefix) const
    {
        int done = current + 1;
        bool last = (done == total);

        if (done % _interval == 0 || last)
        {
            _os << prefix << whirl(done) << " " << done << " of " << total
                << " (" << int(done * 100.0 / total) << "%)" << '\r' << std::flush;
        }

        if (last) _os << std::endl;
    }

    /// Prints "prefix current", for loops of unknown length
    void operator() (int current, const std::string& prefix) const
    {
        if (current % _interval == 0)
        {
            _os << prefix << whirl(current) << " " << current << '\r' << std::flush;
        }
    }

    private:

    char whirl(int n) const
    {
        static const char w[4] = { '-', '\\', '|', '/' };
        return w[(n / _interval) % 4];
    }

    int           _interval;
    std::ostream& _os;
};

} // namespace w2cv

#endif // UTIL__PROGRESS_HPP
