/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__TYPE_NAMES_HPP
#define IO__TYPE_NAMES_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <utility>

#include <boost/cstdint.hpp>

namespace w2cv {

/**
 * @ingroup io
 * @brief Portable name of a serialized element type.
 *
 * Property files store the name of their element type so that a reader can refuse
 * a file written for a different type. Specialize type_name for every additional
 * type written to a property file.
 */
template <class T> struct type_name;

template <> struct type_name<int8_t>      { static std::string get() { return "i8";  } };
template <> struct type_name<int32_t>     { static std::string get() { return "i32"; } };
template <> struct type_name<int64_t>     { static std::string get() { return "i64"; } };
template <> struct type_name<uint8_t>     { static std::string get() { return "u8";  } };
template <> struct type_name<uint32_t>    { static std::string get() { return "u32"; } };
template <> struct type_name<uint64_t>    { static std::string get() { return "u64"; } };
template <> struct type_name<float>       { static std::string get() { return "f32"; } };
template <> struct type_name<double>      { static std::string get() { return "f64"; } };
template <> struct type_name<std::string> { static std::string get() { return "string"; } };

template <class T> struct type_name<std::vector<T> >
{
    static std::string get() { return "vector<" + type_name<T>::get() + ">"; }
};

template <class T> struct type_name<std::set<T> >
{
    static std::string get() { return "set<" + type_name<T>::get() + ">"; }
};

template <class T1, class T2> struct type_name<std::pair<T1, T2> >
{
    static std::string get() { return "pair<" + type_name<T1>::get() + "," + type_name<T2>::get() + ">"; }
};

template <class T1, class T2> struct type_name<std::map<T1, T2> >
{
    static std::string get() { return "map<" + type_name<T1>::get() + "," + type_name<T2>::get() + ">"; }
};

template <class T> inline
std::string nameof()
{
    return type_name<T>::get();
}

} // namespace w2cv

#endif // IO__TYPE_NAMES_HPP
