/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__IO_HPP
#define IO__IO_HPP

#include <istream>
#include <ostream>
#include <stdexcept>
#include <vector>
#include <map>
#include <set>

#include <boost/cstdint.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/type_traits/is_arithmetic.hpp>

namespace w2cv {

/**
 * @ingroup io
 * @brief Binary serialization of the datatypes stored in property files and vector stores.
 *
 * Supports arithmetic types, std::string and the STL containers vector<T>, set<T>, map<S,T>
 * and pair<T1,T2> as well as arbitrary nestings of those. Files are portable between
 * 32-bit and 64-bit machines but not between machines of differing endianness.
 *
 * Reading is checked: a truncated stream or an element count that cannot possibly be
 * satisfied by the bytes left in the stream raises io::format_error instead of
 * allocating garbage.
 */
namespace io
{
    /// Raised whenever the data in a stream does not have the expected layout
    struct format_error : public std::runtime_error
    {
        explicit format_error(const std::string& what) : std::runtime_error(what) {}
    };

    // ----------------------------------------------------------------------------
    // Signatures -- needed to allow arbitrary nestings in the implementation
    // part below, e.g. reading a vector<pair<T1,T2>>
    // ----------------------------------------------------------------------------

    template <class T1, class T2>
    size_t write(std::ostream& os, const std::pair<T1, T2>& v);

    template <class T1, class T2>
    size_t read(std::istream& is, std::pair<T1, T2>& v);

    template <class T>
    size_t write(std::ostream& os, const std::vector<T>& v);

    template <class T>
    size_t read(std::istream& is, std::vector<T>& v);

    template <class T1, class T2>
    size_t write(std::ostream& os, const std::map<T1, T2>& v);

    template <class T1, class T2>
    size_t read(std::istream& is, std::map<T1, T2>& v);

    template <class T>
    size_t write(std::ostream& os, const std::set<T>& v);

    template <class T>
    size_t read(std::istream& is, std::set<T>& v);


    // ----------------------------------------------------------------------------
    // Helpers
    // ----------------------------------------------------------------------------

    /// Number of bytes between the current read position and the end of the stream,
    /// -1 if the stream is not seekable
    inline int64_t remaining(std::istream& is)
    {
        std::streampos pos = is.tellg();
        if (pos == std::streampos(-1)) return -1;
        is.seekg(0, std::ios::end);
        std::streampos end = is.tellg();
        is.seekg(pos);
        return static_cast<int64_t>(end - pos);
    }

    inline void check(std::istream& is, const char* what)
    {
        if (!is) throw format_error(std::string("unexpected end of data while reading ") + what);
    }

    /// Validates an element count read from a stream, each element occupying
    /// at least min_bytes in the stream
    inline void check_count(std::istream& is, int64_t count, size_t min_bytes)
    {
        if (count < 0)
        {
            throw format_error("negative element count " + boost::lexical_cast<std::string>(count));
        }
        int64_t left = remaining(is);
        if (left >= 0 && min_bytes > 0 && count > left / static_cast<int64_t>(min_bytes))
        {
            throw format_error("element count " + boost::lexical_cast<std::string>(count)
                               + " exceeds remaining data (" + boost::lexical_cast<std::string>(left) + " bytes)");
        }
    }


    // ----------------------------------------------------------------------------
    // Implementations
    // ----------------------------------------------------------------------------

    template <class T>
    size_t _write(std::ostream& os, T v)
    {
        os.write(reinterpret_cast<char*>(&v), sizeof(T));
        return sizeof(v);
    }

    template <class T>
    size_t _read(std::istream& is, T& v)
    {
        is.read(reinterpret_cast<char*>(&v), sizeof(T));
        check(is, "scalar");
        return sizeof(v);
    }

    inline size_t write(std::ostream& os, int8_t v)   { return _write(os, v); }
    inline size_t write(std::ostream& os, int16_t v)  { return _write(os, v); }
    inline size_t write(std::ostream& os, int32_t v)  { return _write(os, v); }
    inline size_t write(std::ostream& os, int64_t v)  { return _write(os, v); }
    inline size_t write(std::ostream& os, uint8_t v)  { return _write(os, v); }
    inline size_t write(std::ostream& os, uint16_t v) { return _write(os, v); }
    inline size_t write(std::ostream& os, uint32_t v) { return _write(os, v); }
    inline size_t write(std::ostream& os, uint64_t v) { return _write(os, v); }
    inline size_t write(std::ostream& os, float v)    { return _write(os, v); }
    inline size_t write(std::ostream& os, double v)   { return _write(os, v); }
    inline size_t write(std::ostream& os, const std::string& v)
    {
        size_t t = write(os, static_cast<int32_t>(v.length()));
        os.write(v.data(), v.length());
        return t + v.length();
    }

    inline size_t read(std::istream& is, int8_t& v)   { return _read(is, v); }
    inline size_t read(std::istream& is, int16_t& v)  { return _read(is, v); }
    inline size_t read(std::istream& is, int32_t& v)  { return _read(is, v); }
    inline size_t read(std::istream& is, int64_t& v)  { return _read(is, v); }
    inline size_t read(std::istream& is, uint8_t& v)  { return _read(is, v); }
    inline size_t read(std::istream& is, uint16_t& v) { return _read(is, v); }
    inline size_t read(std::istream& is, uint32_t& v) { return _read(is, v); }
    inline size_t read(std::istream& is, uint64_t& v) { return _read(is, v); }
    inline size_t read(std::istream& is, float& v)    { return _read(is, v); }
    inline size_t read(std::istream& is, double& v)   { return _read(is, v); }
    inline size_t read(std::istream& is, std::string& v)
    {
        int32_t s = 0;
        size_t t = read(is, s);
        check_count(is, s, 1);
        v.resize(s);
        if (s > 0) is.read(&v[0], s);
        check(is, "string");
        return t + s;
    }


    // writing vectors of floats is by far the most common operation,
    // arithmetic element types are therefore written as one block
    template <class T>
    size_t write(std::ostream& os, const std::vector<T>& v)
    {
        size_t t = write(os, static_cast<int64_t>(v.size()));

        if (boost::is_arithmetic<T>::value)
        {
            size_t num_bytes = v.size()*sizeof(T);
            if (num_bytes > 0) os.write(reinterpret_cast<const char*>(&v[0]), num_bytes);
            t += num_bytes;
        }
        else
        {
            for (size_t i = 0; i < v.size(); i++) t += write(os, v[i]);
        }

        return t;
    }

    template <class T>
    size_t read(std::istream& is, std::vector<T>& v)
    {
        int64_t size = 0;
        size_t t = read(is, size);

        if (boost::is_arithmetic<T>::value)
        {
            check_count(is, size, sizeof(T));
            v.resize(size);
            size_t num_bytes = size*sizeof(T);
            if (num_bytes > 0) is.read(reinterpret_cast<char*>(&v[0]), num_bytes);
            check(is, "vector");
            t += num_bytes;
        }
        else
        {
            // nested elements take at least their own size field
            check_count(is, size, sizeof(int32_t));
            v.resize(size);
            for (int64_t i = 0; i < size; i++) t += read(is, v[i]);
        }
        return t;
    }

    template <class T1, class T2>
    size_t write(std::ostream& os, const std::pair<T1, T2>& v)
    {
        size_t s = write(os, v.first);
        s += write(os, v.second);
        return s;
    }

    template <class T1, class T2>
    size_t read(std::istream& is, std::pair<T1, T2>& v)
    {
        size_t s = read(is, v.first);
        s += read(is, v.second);
        return s;
    }

    template <class T>
    size_t write(std::ostream& os, const std::set<T>& v)
    {
        size_t s = write(os, static_cast<int64_t>(v.size()));
        for (typename std::set<T>::const_iterator it = v.begin(); it != v.end(); ++it)
        {
            s += write(os, *it);
        }
        return s;
    }

    template <class T>
    size_t read(std::istream& is, std::set<T>& v)
    {
        v.clear();
        int64_t size = 0;
        size_t s = read(is, size);
        check_count(is, size, 1);
        for (int64_t i = 0; i < size; i++)
        {
            T x;
            s += read(is, x);
            v.insert(x);
        }
        return s;
    }

    template <class T1, class T2>
    size_t write(std::ostream& os, const std::map<T1, T2>& v)
    {
        size_t s = write(os, static_cast<int64_t>(v.size()));
        for (typename std::map<T1, T2>::const_iterator it = v.begin(); it != v.end(); ++it)
        {
            s += write(os, *it);
        }
        return s;
    }

    template <class T1, class T2>
    size_t read(std::istream& is, std::map<T1, T2>& v)
    {
        v.clear();
        int64_t size = 0;
        size_t s = read(is, size);
        check_count(is, size, 2);
        for (int64_t i = 0; i < size; i++)
        {
            std::pair<T1, T2> x;
            s += read(is, x);
            v.insert(x);
        }
        return s;
    }
}

} // namespace w2cv

#endif // IO__IO_HPP
