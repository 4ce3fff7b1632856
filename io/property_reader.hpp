/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__PROPERTY_READER_HPP
#define IO__PROPERTY_READER_HPP

#include <fstream>

#include <boost/noncopyable.hpp>

#include "../util/types.hpp"
#include "io.hpp"
#include "type_names.hpp"
#include "property_writer.hpp"

namespace w2cv {

/// \addtogroup io
/// @{

/**
 * @brief Reads a property file that has been written by PropertyWriterT<T>.
 *
 * The constructor reads the trailer (offsets and entries) only, elements are read
 * on demand by operator[]. Files of a different format version or element type are
 * refused with a std::runtime_error.
 */
template <class T>
class PropertyReaderT : boost::noncopyable
{
public:

    explicit PropertyReaderT(const string& filename)
        : _filename(filename)
    {
        _ifs.open(filename.c_str(), std::ifstream::binary);
        if (!_ifs.is_open()) throw std::runtime_error("could not open file " + filename);

        try
        {
            _ifs.seekg(0, std::ios::end);
            int64_t filesize = _ifs.tellg();
            if (filesize < static_cast<int64_t>(sizeof(int64_t))) throw io::format_error("file too small");

            int64_t p_map = 0;
            _ifs.seekg(filesize - sizeof(int64_t));
            io::read(_ifs, p_map);
            if (p_map < 0 || p_map >= filesize) throw io::format_error("invalid trailer position");

            _ifs.seekg(p_map);
            io::read(_ifs, _map);

            int version = get<int>(_map, "__version", -1);
            if (version != property_file_version())
            {
                throw io::format_error("unsupported version " + boost::lexical_cast<string>(version)
                                       + ", expected " + boost::lexical_cast<string>(property_file_version()));
            }

            string type_name = get<string>(_map, "__typeinfo");
            if (type_name != nameof<T>())
            {
                throw io::format_error("file holds elements of type " + type_name + ", expected " + nameof<T>());
            }

            int64_t p_offsets = get<int64_t>(_map, "__offsets", -1);
            if (p_offsets < 0 || p_offsets > p_map) throw io::format_error("invalid offsets position");
            _ifs.seekg(p_offsets);
            io::read(_ifs, _offset);

            for (size_t i = 0; i < _offset.size(); i++)
            {
                if (_offset[i] < 0 || _offset[i] >= p_offsets) throw io::format_error("invalid element offset");
            }
        }
        catch (const std::exception& e)
        {
            throw std::runtime_error("malformed property file " + filename + ": " + e.what());
        }
    }

    index_t size() const
    {
        return _offset.size();
    }

    /// Reads element i from the file, i must be in [0, size())
    T operator[](index_t i)
    {
        if (i < 0 || i >= size()) throw std::out_of_range("property index out of range in " + _filename);

        T element;
        _ifs.clear();
        _ifs.seekg(_offset[i]);

        try
        {
            using io::read;
            read(_ifs, element);
        }
        catch (const std::exception& e)
        {
            throw std::runtime_error("malformed element in property file " + _filename + ": " + e.what());
        }
        return element;
    }

    /// User entry stored alongside the elements, see PropertyWriterT::set_entry()
    optional<string> entry(const string& key) const
    {
        strmap_t::const_iterator it = _map.find(key);
        if (it == _map.end()) return optional<string>();
        return it->second;
    }

private:

    string               _filename;
    std::ifstream        _ifs;
    std::vector<int64_t> _offset;
    strmap_t             _map;
};


/// Convenience function to read all elements of a property file into a vector<T>
template <class T>
void read_property(std::vector<T>& v, const std::string& filename)
{
    PropertyReaderT<T> reader(filename);
    std::vector<T> tmp(reader.size());
    for (index_t i = 0; i < reader.size(); i++) tmp[i] = reader[i];
    v.swap(tmp);
}

/// @} // end addtogroup

} // namespace w2cv

#endif // IO__PROPERTY_READER_HPP
