/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef UTIL__TYPES_HPP
#define UTIL__TYPES_HPP

#include <vector>
#include <map>
#include <set>
#include <string>
#include <utility>

#include <boost/cstdint.hpp>
#include <boost/any.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <opencv2/core/core.hpp>


namespace w2cv {

// namespace includes
using boost::shared_ptr;
using boost::make_shared;
using boost::any_cast;
using boost::scoped_ptr;
using boost::optional;
using boost::property_tree::ptree;
using boost::function;

using std::string;
using std::vector;
using std::pair;
using std::make_pair;
using std::map;
using std::set;

typedef unsigned int uint;
typedef int64_t      index_t;

/// Raw decoded image as delivered by OpenCV: 8 bit, 3 channels, BGR order.
typedef cv::Mat_<cv::Vec3b> mat_8uc3_t;

/// Image in a perceptual color space, one float per channel.
typedef cv::Mat_<cv::Vec3f> mat_32fc3_t;

typedef std::vector<float>     vec_f32_t;
typedef std::vector<double>    vec_f64_t;
typedef std::vector<int32_t>   vec_i32_t;
typedef std::vector<uint32_t>  vec_u32_t;
typedef std::vector<uint8_t>   vec_u8_t;

typedef std::vector<vec_f32_t> vec_vec_f32_t;

typedef std::map<std::string, std::string> strmap_t;

template <class T> inline
T get(const strmap_t& map, const std::string& key, const T& defaultvalue = T())
{
    strmap_t::const_iterator it = map.find(key);
    return (it != map.end()) ? boost::lexical_cast<T>(it->second) : defaultvalue;
}

// Returns the value that is stored in the property_tree under path.
// If path does not exist, the default value is inserted into the tree
// and returned.
template <class T> inline
T parse(ptree& p, const string& path, const T& default_value)
{
    T value = p.get(path, default_value);
    p.put(path, value);
    return value;
}

} // namespace w2cv

#endif // UTIL__TYPES_HPP
