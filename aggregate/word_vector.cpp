/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include "word_vector.hpp"
#include "../util/errors.hpp"

namespace w2cv {

WordVector merge(const WordVector& a, const WordVector& b)
{
    if (a.word != b.word || a.revision != b.revision)
    {
        throw IncompatibleVectors("cannot merge (" + a.word + ", " + a.revision + ") with ("
                                  + b.word + ", " + b.revision + ")");
    }

    return WordVector(a.word, a.revision, RunningStats::merge(a.stats, b.stats));
}

} // namespace w2cv
