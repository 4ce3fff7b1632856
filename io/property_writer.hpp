/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__PROPERTY_WRITER_HPP
#define IO__PROPERTY_WRITER_HPP

#include <cassert>
#include <fstream>
#include <iostream>

#include <boost/noncopyable.hpp>

#include "../util/types.hpp"
#include "io.hpp"
#include "type_names.hpp"


namespace w2cv {

/// \addtogroup io
/// @{


/// Current layout of property files, PropertyReaderT refuses all other versions
inline int property_file_version()
{
    return 3;
}


/**
  * @brief Interface for the templated PropertyWriterT.
  *
  * Elements are passed as boost::any such that writers of different element types
  * can be held in one container, see OrderedPushBack.
  */
struct PropertyWriter
{
    virtual ~PropertyWriter() {}
    virtual void open(const string& filename) = 0;
    virtual void push_back(const boost::any& element) = 0;
    virtual void set_entry(const string& key, const string& value) = 0;
    virtual size_t size() const = 0;
};


/**
 * @brief Writes a binary 'property file' holding a sequence of elements of type T.
 *
 * Layout: all elements back to back, followed by the vector of their offsets, followed
 * by a string map holding the format version, the element type name and user entries,
 * followed by the offset of that map as the last 8 bytes of the file. The trailer is
 * written when the writer is closed or destroyed.
 *
 * We use property files for the resources shared by all images (color lookup table,
 * linear transforms) and for dumping colorgrams.
 *
 * Note: instances are noncopyable since they internally open files.
 */
template <class T>
class PropertyWriterT : public PropertyWriter, boost::noncopyable
{
public:

    PropertyWriterT() {}

    /// Open the passed filename for writing, if the file aready exists, its content will be overwritten
    explicit PropertyWriterT(const string& filename)
    {
        this->open(filename);
    }

    /// Open the passed filename for writing, if the file aready exists, its content will be overwritten
    void open(const string& filename)
    {
        _ofs.open(filename.c_str(), std::ofstream::binary|std::ofstream::trunc);
        if (!_ofs.is_open()) throw std::runtime_error("could not open file " + filename);
        _filename = filename;
        _map["__version"] = boost::lexical_cast<std::string>(property_file_version());
        _map["__typeinfo"] = nameof<T>();
    }

    ~PropertyWriterT()
    {
        // never throw from the destructor, call close() to see errors
        try { close(); }
        catch (const std::exception& e) { std::cerr << "PropertyWriterT: " << e.what() << std::endl; }
    }

    /// Writes the trailer and closes the file
    void close()
    {
        if (!_ofs.is_open()) return;

        int64_t p_offsets = _ofs.tellp();
        _map["__offsets"] = boost::lexical_cast<std::string>(p_offsets);
        io::write(_ofs, _offset);

        int64_t p_map = _ofs.tellp();
        io::write(_ofs, _map);
        io::write(_ofs, p_map);

        bool good = _ofs.good();
        _ofs.close();
        if (!good) throw std::runtime_error("failed writing property file " + _filename);
    }

    /// Append an element to the end of the file
    void push_back(const boost::any& element)
    {
        push_back_value(boost::any_cast<const T&>(element));
    }

    void push_back_value(const T& element)
    {
        assert(_ofs.is_open());
        _offset.push_back(_ofs.tellp());

        // unqualified such that overloads next to user types are found as well
        using io::write;
        write(_ofs, element);

        if (!_ofs.good()) throw std::runtime_error("failed writing element to " + _filename);
    }

    /// Attach a key/value entry to the file, keys starting with "__" are reserved
    void set_entry(const string& key, const string& value)
    {
        if (key.compare(0, 2, "__") == 0) throw std::invalid_argument("reserved property entry: " + key);
        _map[key] = value;
    }

    size_t size() const
    {
        return _offset.size();
    }

private:

    string               _filename;
    std::ofstream        _ofs;
    std::vector<int64_t> _offset;
    strmap_t             _map;
};


/**
 * @brief Convenience function to write a complete vector<T> to filename.
 *
 * Overwrites existing content in case the file already exists, otherwise it will be created.
 */
template <class T>
void write_property(const std::vector<T>& v, const std::string& filename, const strmap_t& entries = strmap_t())
{
    PropertyWriterT<T> wr(filename);
    for (strmap_t::const_iterator it = entries.begin(); it != entries.end(); ++it) wr.set_entry(it->first, it->second);
    for (size_t i = 0; i < v.size(); i++) wr.push_back_value(v[i]);
    wr.close();
}

/// @} // end addtogroup

} // end namespace

#endif // IO__PROPERTY_WRITER_HPP
