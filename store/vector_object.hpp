/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef STORE__VECTOR_OBJECT_HPP
#define STORE__VECTOR_OBJECT_HPP

#include <istream>
#include <ostream>

#include <boost/variant.hpp>

#include "../util/types.hpp"
#include "../io/type_names.hpp"
#include "../descriptors/colorgram.hpp"
#include "../descriptors/feature_vector.hpp"
#include "../aggregate/word_vector.hpp"

namespace w2cv {

/// \addtogroup store
/// @{

/**
 * @brief Any of the vector types that can be persisted.
 *
 * Serialized as an int8 tag followed by the payload of the held type.
 */
typedef boost::variant<FeatureVector, Colorgram, WordVector> vector_object_t;

enum vector_tag_t
{
    tag_feature_vector = 1,
    tag_colorgram      = 2,
    tag_word_vector    = 3
};

/// Tag of the type currently held by object
vector_tag_t tag_of(const vector_object_t& object);

// Binary serialization in the format of io::write()/io::read(). All readers validate
// their payload (sizes, non-finite values, counts) and throw io::format_error.

size_t write(std::ostream& os, const FeatureVector& v);
size_t read(std::istream& is, FeatureVector& v);

size_t write(std::ostream& os, const Colorgram& v);
size_t read(std::istream& is, Colorgram& v);

size_t write(std::ostream& os, const WordVector& v);
size_t read(std::istream& is, WordVector& v);

size_t write(std::ostream& os, const vector_object_t& v);
size_t read(std::istream& is, vector_object_t& v);

template <> struct type_name<FeatureVector>   { static std::string get() { return "feature_vector"; } };
template <> struct type_name<Colorgram>       { static std::string get() { return "colorgram"; } };
template <> struct type_name<WordVector>      { static std::string get() { return "word_vector"; } };
template <> struct type_name<vector_object_t> { static std::string get() { return "vector_object"; } };

/// @} // end addtogroup

} // namespace w2cv

#endif // STORE__VECTOR_OBJECT_HPP
