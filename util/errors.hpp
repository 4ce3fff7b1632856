/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef UTIL__ERRORS_HPP
#define UTIL__ERRORS_HPP

#include <stdexcept>
#include <string>

namespace w2cv {

/**
 * @ingroup util
 * @brief Base class of all errors raised by the library.
 *
 * Derived classes only differ in their type, the message carries the
 * details. Catch Error to handle every library failure in one place,
 * catch a derived class to react to one failure kind.
 */
class Error : public std::runtime_error
{
    public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Input image is malformed: wrong channel count or values outside [0,255].
class InvalidPixelRange : public Error
{
    public:
    explicit InvalidPixelRange(const std::string& what) : Error(what) {}
};

/// The color lookup table resource is absent or unusable.
class MissingColorTable : public Error
{
    public:
    explicit MissingColorTable(const std::string& what) : Error(what) {}
};

/// A linear transform has been configured but is not available.
class MissingTransform : public Error
{
    public:
    explicit MissingTransform(const std::string& what) : Error(what) {}
};

/// Vector lengths do not agree.
class DimensionMismatch : public Error
{
    public:
    explicit DimensionMismatch(const std::string& what) : Error(what) {}
};

/// A persisted store cannot be read back.
class CorruptStore : public Error
{
    public:
    explicit CorruptStore(const std::string& what) : Error(what) {}
};

/// Two word vectors with different word or revision were about to be merged.
class IncompatibleVectors : public Error
{
    public:
    explicit IncompatibleVectors(const std::string& what) : Error(what) {}
};

/// Attempt to modify a revision after it has been finalized.
class RevisionFinalized : public Error
{
    public:
    explicit RevisionFinalized(const std::string& what) : Error(what) {}
};

/// An image is contributed a second time to the same (word, revision).
class DuplicateImage : public Error
{
    public:
    explicit DuplicateImage(const std::string& what) : Error(what) {}
};

} // namespace w2cv

#endif // UTIL__ERRORS_HPP
