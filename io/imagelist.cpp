/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include "imagelist.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <boost/algorithm/string.hpp>
#include <boost/assert.hpp>

#include "property_reader.hpp"
#include "property_writer.hpp"


namespace w2cv {

ImageList::ImageList(const string& root_dir)
{
    set_root_dir(root_dir);
}

const string& ImageList::root_dir() const
{
    return _rootdir;
}

void ImageList::set_root_dir(const string& root_dir)
{
    QDir dir(QString::fromStdString(root_dir));
    if (!dir.exists())
    {
        throw std::runtime_error("ImageList rootdir <" + root_dir + "> does not exist.");
    }
    _rootdir = root_dir;
}

size_t ImageList::size() const
{
    return _entries.size();
}

const string& ImageList::image_id(size_t index) const
{
    BOOST_ASSERT(index < _entries.size());
    return _entries[index].first;
}

string ImageList::get_filename(size_t index) const
{
    return _rootdir + "/" + image_id(index);
}

const string& ImageList::word(size_t index) const
{
    BOOST_ASSERT(index < _entries.size());
    return _entries[index].second;
}

vector<string> ImageList::words() const
{
    set<string> words;
    for (size_t i = 0; i < _entries.size(); i++) words.insert(_entries[i].second);
    return vector<string>(words.begin(), words.end());
}

const vector<ImageList::entry_t>& ImageList::entries() const
{
    return _entries;
}

string ImageList::word_from_path(const string& relative_filename) const
{
    string::size_type p = relative_filename.find('/');
    if (p != string::npos && p > 0) return relative_filename.substr(0, p);

    // files directly in the root directory are labeled with the root directory's name
    return QFileInfo(QDir(QString::fromStdString(_rootdir)).absolutePath()).fileName().toStdString();
}

void ImageList::add(const string& relative_filename, const string& word)
{
    _entries.push_back(entry_t(relative_filename, word.empty() ? word_from_path(relative_filename) : word));
}

void ImageList::set_word(const string& word)
{
    for (size_t i = 0; i < _entries.size(); i++) _entries[i].second = word;
}

void ImageList::lookup_dir(const vector<string>& namefilters, callback_fn callback)
{
    QStringList qnamefilters;
    for (size_t i = 0; i < namefilters.size(); i++)
    {
        qnamefilters.push_back(QString::fromStdString(namefilters[i]));
    }

    QDir root(QString::fromStdString(_rootdir));

    // NOTE: relative path resolution works only with an absolute path passed to QDirIterator
    QDirIterator it(root.absolutePath(),
                    qnamefilters,
                    QDir::Files | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);

    vector<string> files;
    while (it.hasNext())
    {
        QString p = it.next();
        files.push_back(root.relativeFilePath(p).toStdString());
    }

    // QDirIterator order depends on the file system
    std::sort(files.begin(), files.end());

    vector<entry_t> entries;
    for (size_t i = 0; i < files.size(); i++)
    {
        entries.push_back(entry_t(files[i], word_from_path(files[i])));
        if (callback) callback(i, files[i]);
    }

    _entries = entries;
}

void ImageList::load(const string& filename)
{
    // parse into a temporary, _entries stays unchanged if anything fails
    vector<entry_t> entries;

    try
    {
        read_property(entries, filename);
    }
    catch (const std::exception& e)
    {
        // not a property file, try plain text
        std::ifstream ifs(filename.c_str());
        if (!ifs.is_open()) throw std::runtime_error("could not open image list " + filename);

        entries.clear();
        string line;
        while (std::getline(ifs, line))
        {
            if (line.find('\0') != string::npos)
            {
                throw std::runtime_error("malformed image list " + filename + ": " + e.what());
            }

            boost::algorithm::trim(line);
            if (line.empty() || line[0] == '#') continue;

            vector<string> fields;
            boost::algorithm::split(fields, line, boost::algorithm::is_any_of("\t"));
            string file = boost::algorithm::trim_copy(fields[0]);
            string word = fields.size() > 1 ? boost::algorithm::trim_copy(fields[1]) : string();
            entries.push_back(entry_t(file, word.empty() ? word_from_path(file) : word));
        }
    }

    _entries = entries;
}

void ImageList::store(const string& filename) const
{
    // possibly throws an exception that needs to be caught
    // in the application using this function
    write_property(_entries, filename);
}

} // namespace w2cv
