/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__IMAGELIST_HPP
#define IO__IMAGELIST_HPP

#include "../util/types.hpp"

namespace w2cv {

/**
 * @ingroup io
 * \brief Holds a vector of image filenames relative to a root directory, each labeled with a word.
 *
 * The usual layout of a data set is one directory per word below the root directory,
 * e.g. root/ocean/0001.jpg. lookup_dir() therefore labels each file with the first
 * component of its relative path, files directly in the root directory get the name
 * of the root directory itself. The labels can be overridden with set_word().
 *
 * The order of the list is independent of the file system. It determines the order
 * of the results of a batch and of the colorgram dump, i.e. element i of the dump
 * belongs to image i.
 */
class ImageList
{
    public:

    typedef pair<string, string>                      entry_t;   // (relative filename, word)
    typedef boost::function<void (int, const string&)> callback_fn;

    /// The directory passed in must be a valid, existing directory
    /// @throw std::runtime_error if root_dir does not exist
    ImageList(const string& root_dir = ".");

    /// @throw std::runtime_error if root_dir does not exist
    void set_root_dir(const string& root_dir);

    /// List all files found in and below the root directory that match one of namefilters, e.g. "*.jpg"
    void lookup_dir(const vector<string>& namefilters, callback_fn callback = callback_fn());

    /**
     * @brief Load a list written by store(), or a plain text file with one relative filename per line.
     *
     * Plain text lines may carry the word after a tab character, otherwise the word is
     * derived from the path like in lookup_dir().
     *
     * @throw std::runtime_error if the file does not exist or cannot be parsed
     */
    void load(const string& filename);

    /// Save the list, the root directory is not stored
    /// @throw std::runtime_error if filename can not be opened for writing
    void store(const string& filename) const;

    /// Append relative filename labeled with word, an empty word is derived from the path
    void add(const string& relative_filename, const string& word = "");

    /// Label all images with word
    void set_word(const string& word);

    const string& root_dir() const;
    size_t size() const;

    /// Image id of image i, its filename relative to the root directory
    const string& image_id(size_t index) const;

    /// root_dir + '/' + image_id(index)
    string get_filename(size_t index) const;

    const string& word(size_t index) const;

    /// Sorted list of all distinct words
    vector<string> words() const;

    const vector<entry_t>& entries() const;

    private:

    string word_from_path(const string& relative_filename) const;

    string          _rootdir;
    vector<entry_t> _entries;
};

} // end namespace

#endif // IO__IMAGELIST_HPP
