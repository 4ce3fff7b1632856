/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <fstream>
#include <stdexcept>

#include <boost/thread/locks.hpp>

#include <QDateTime>

#include "vector_store.hpp"
#include "vector_object.hpp"
#include "../io/io.hpp"
#include "../util/errors.hpp"

namespace w2cv {

namespace {

template <class T>
ptree to_array(const std::vector<T>& v)
{
    ptree array;
    for (size_t i = 0; i < v.size(); i++)
    {
        ptree element;
        element.put_value(v[i]);
        array.push_back(make_pair("", element));
    }
    return array;
}

} // anonymous namespace

const string& VectorStore::magic()
{
    static const string m("w2cv-store");
    return m;
}

int32_t VectorStore::schema_version()
{
    return 1;
}

VectorStore::VectorStore()
{
    _contents.meta["created"] = QDateTime::currentDateTime().toString(Qt::ISODate).toStdString();
}

void VectorStore::_check_not_finalized(const string& revision) const
{
    // precondition: _mutex is locked
    if (_contents.finalized.count(revision))
    {
        throw RevisionFinalized("revision '" + revision + "' is finalized");
    }
}

bool VectorStore::_has_revision(const string& revision) const
{
    // precondition: _mutex is locked
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        if (it->first.second == revision) return true;
    }
    for (feature_map_t::const_iterator it = _contents.features.begin(); it != _contents.features.end(); ++it)
    {
        if (it->first.second == revision && !it->second.empty()) return true;
    }
    return false;
}

void VectorStore::_snapshot(Contents& contents) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    contents.features = _contents.features;
    contents.finalized = _contents.finalized;
    contents.meta = _contents.meta;
    contents.words.clear();

    // deep copy, entries must not be shared between stores
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        boost::lock_guard<boost::mutex> entry_lock(it->second->mutex);
        contents.words[it->first] = make_shared<Entry>(it->second->stats);
    }
}

void VectorStore::put(const FeatureVector& v)
{
    if (v.word.empty() || v.revision.empty() || v.image_id.empty())
    {
        throw std::invalid_argument("feature vector needs word, revision and image id");
    }

    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _check_not_finalized(v.revision);
    _contents.features[word_key_t(v.word, v.revision)][v.image_id] = v;
}

void VectorStore::put(const WordVector& v)
{
    if (v.count() == 0) throw std::invalid_argument("word vector (" + v.word + ", " + v.revision + ") is empty");
    if (v.word.empty() || v.revision.empty()) throw std::invalid_argument("word vector needs word and revision");

    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _check_not_finalized(v.revision);

    word_map_t::iterator it = _contents.words.find(word_key_t(v.word, v.revision));
    if (it != _contents.words.end())
    {
        boost::lock_guard<boost::mutex> entry_lock(it->second->mutex);
        it->second->stats = v.stats;
    }
    else
    {
        _contents.words[word_key_t(v.word, v.revision)] = make_shared<Entry>(v.stats);
    }
}

optional<WordVector> VectorStore::get(const string& word, const string& revision) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    word_map_t::const_iterator it = _contents.words.find(word_key_t(word, revision));
    if (it == _contents.words.end()) return optional<WordVector>();

    boost::lock_guard<boost::mutex> entry_lock(it->second->mutex);
    return WordVector(word, revision, it->second->stats);
}

optional<FeatureVector> VectorStore::get(const string& word, const string& revision, const string& image_id) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    feature_map_t::const_iterator it = _contents.features.find(word_key_t(word, revision));
    if (it == _contents.features.end()) return optional<FeatureVector>();

    map<string, FeatureVector>::const_iterator fit = it->second.find(image_id);
    if (fit == it->second.end()) return optional<FeatureVector>();
    return fit->second;
}

vector<FeatureVector> VectorStore::features(const string& word, const string& revision) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    vector<FeatureVector> result;
    feature_map_t::const_iterator it = _contents.features.find(word_key_t(word, revision));
    if (it == _contents.features.end()) return result;

    for (map<string, FeatureVector>::const_iterator fit = it->second.begin(); fit != it->second.end(); ++fit)
    {
        result.push_back(fit->second);
    }
    return result;
}

vector<string> VectorStore::list_words(const string& revision) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    vector<string> words;
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        if (it->first.second == revision) words.push_back(it->first.first);
    }
    return words;
}

vector<string> VectorStore::list_words() const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    set<string> words;
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        words.insert(it->first.first);
    }
    return vector<string>(words.begin(), words.end());
}

vector<string> VectorStore::list_revisions() const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    set<string> revisions(_contents.finalized);
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        revisions.insert(it->first.second);
    }
    for (feature_map_t::const_iterator it = _contents.features.begin(); it != _contents.features.end(); ++it)
    {
        if (!it->second.empty()) revisions.insert(it->first.second);
    }
    return vector<string>(revisions.begin(), revisions.end());
}

size_t VectorStore::num_word_vectors() const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);
    return _contents.words.size();
}

size_t VectorStore::num_feature_vectors() const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);

    size_t n = 0;
    for (feature_map_t::const_iterator it = _contents.features.begin(); it != _contents.features.end(); ++it)
    {
        n += it->second.size();
    }
    return n;
}

WordVector VectorStore::modify(const string& word, const string& revision, const modifier_fn& fn)
{
    const word_key_t key(word, revision);

    // common case: the entry exists, only its own mutex is locked exclusively.
    // The shared lock is held until the update is done, finalize() and import
    // therefore wait for all running updates.
    {
        boost::shared_lock<boost::shared_mutex> lock(_mutex);
        _check_not_finalized(revision);

        word_map_t::iterator it = _contents.words.find(key);
        if (it != _contents.words.end())
        {
            Entry& entry = *it->second;
            boost::lock_guard<boost::mutex> entry_lock(entry.mutex);

            RunningStats stats(entry.stats);
            fn(stats);
            entry.stats = stats;
            return WordVector(word, revision, stats);
        }
    }

    // first contribution to this key, the map itself has to change
    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _check_not_finalized(revision);

    // another thread may have created the entry in the meantime
    word_map_t::iterator it = _contents.words.find(key);
    if (it != _contents.words.end())
    {
        RunningStats stats(it->second->stats);
        fn(stats);
        it->second->stats = stats;
        return WordVector(word, revision, stats);
    }

    RunningStats stats;
    fn(stats);
    if (stats.count() > 0) _contents.words[key] = make_shared<Entry>(stats);
    return WordVector(word, revision, stats);
}

WordVector VectorStore::add(const FeatureVector& v, const modifier_fn& fn)
{
    if (v.word.empty() || v.revision.empty() || v.image_id.empty())
    {
        throw std::invalid_argument("feature vector needs word, revision and image id");
    }

    const word_key_t key(v.word, v.revision);

    // the feature map changes, this needs the exclusive lock
    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _check_not_finalized(v.revision);

    feature_map_t::const_iterator fit = _contents.features.find(key);
    if (fit != _contents.features.end() && fit->second.count(v.image_id))
    {
        throw DuplicateImage("image '" + v.image_id + "' is already part of (" + v.word + ", " + v.revision + ")");
    }

    word_map_t::iterator it = _contents.words.find(key);

    RunningStats stats;
    if (it != _contents.words.end()) stats = it->second->stats;
    fn(stats);

    // nothing has been changed up to here
    _contents.features[key][v.image_id] = v;
    if (it != _contents.words.end()) it->second->stats = stats;
    else if (stats.count() > 0) _contents.words[key] = make_shared<Entry>(stats);

    return WordVector(v.word, v.revision, stats);
}

void VectorStore::finalize(const string& revision)
{
    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _contents.finalized.insert(revision);
}

bool VectorStore::is_finalized(const string& revision) const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);
    return _contents.finalized.count(revision) > 0;
}

size_t VectorStore::merge_revision(const string& source, const string& target)
{
    if (source == target) throw std::invalid_argument("cannot merge revision '" + source + "' into itself");

    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _check_not_finalized(target);

    // compute everything first, a DimensionMismatch must not leave a partial merge behind
    vector<pair<word_key_t, RunningStats> > merged;
    for (word_map_t::const_iterator it = _contents.words.begin(); it != _contents.words.end(); ++it)
    {
        if (it->first.second != source) continue;

        const word_key_t target_key(it->first.first, target);
        word_map_t::const_iterator tit = _contents.words.find(target_key);

        RunningStats stats(it->second->stats);
        if (tit != _contents.words.end()) stats = RunningStats::merge(tit->second->stats, stats);
        merged.push_back(make_pair(target_key, stats));
    }

    for (size_t i = 0; i < merged.size(); i++)
    {
        word_map_t::iterator tit = _contents.words.find(merged[i].first);
        if (tit != _contents.words.end()) tit->second->stats = merged[i].second;
        else _contents.words[merged[i].first] = make_shared<Entry>(merged[i].second);
    }

    vector<FeatureVector> copied;
    for (feature_map_t::const_iterator it = _contents.features.begin(); it != _contents.features.end(); ++it)
    {
        if (it->first.second != source) continue;
        for (map<string, FeatureVector>::const_iterator fit = it->second.begin(); fit != it->second.end(); ++fit)
        {
            copied.push_back(fit->second);
            copied.back().revision = target;
        }
    }

    for (size_t i = 0; i < copied.size(); i++)
    {
        _contents.features[word_key_t(copied[i].word, target)][copied[i].image_id] = copied[i];
    }

    return merged.size();
}

void VectorStore::merge_store(const VectorStore& other)
{
    if (&other == this) throw std::invalid_argument("cannot merge a vector store into itself");

    Contents incoming;
    other._snapshot(incoming);

    set<string> revisions;
    for (word_map_t::const_iterator it = incoming.words.begin(); it != incoming.words.end(); ++it)
    {
        revisions.insert(it->first.second);
    }
    for (feature_map_t::const_iterator it = incoming.features.begin(); it != incoming.features.end(); ++it)
    {
        if (!it->second.empty()) revisions.insert(it->first.second);
    }

    boost::unique_lock<boost::shared_mutex> lock(_mutex);

    for (set<string>::const_iterator it = revisions.begin(); it != revisions.end(); ++it)
    {
        bool finalized = _contents.finalized.count(*it) || incoming.finalized.count(*it);
        if (finalized && _has_revision(*it))
        {
            throw RevisionFinalized("cannot merge into finalized revision '" + *it + "'");
        }
    }

    vector<pair<word_key_t, RunningStats> > merged;
    for (word_map_t::const_iterator it = incoming.words.begin(); it != incoming.words.end(); ++it)
    {
        RunningStats stats(it->second->stats);
        word_map_t::const_iterator own = _contents.words.find(it->first);
        if (own != _contents.words.end()) stats = RunningStats::merge(own->second->stats, stats);
        merged.push_back(make_pair(it->first, stats));
    }

    for (size_t i = 0; i < merged.size(); i++)
    {
        word_map_t::iterator own = _contents.words.find(merged[i].first);
        if (own != _contents.words.end()) own->second->stats = merged[i].second;
        else _contents.words[merged[i].first] = make_shared<Entry>(merged[i].second);
    }

    for (feature_map_t::const_iterator it = incoming.features.begin(); it != incoming.features.end(); ++it)
    {
        map<string, FeatureVector>& own = _contents.features[it->first];
        for (map<string, FeatureVector>::const_iterator fit = it->second.begin(); fit != it->second.end(); ++fit)
        {
            own[fit->first] = fit->second;
        }
    }

    _contents.finalized.insert(incoming.finalized.begin(), incoming.finalized.end());
}

strmap_t VectorStore::meta() const
{
    boost::shared_lock<boost::shared_mutex> lock(_mutex);
    return _contents.meta;
}

void VectorStore::set_meta(const string& key, const string& value)
{
    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    _contents.meta[key] = value;
}

void VectorStore::export_to(const string& filename) const
{
    std::ofstream ofs(filename.c_str(), std::ofstream::binary | std::ofstream::trunc);
    if (!ofs.is_open()) throw std::runtime_error("could not open file " + filename);

    export_to(ofs);

    ofs.close();
    if (!ofs) throw std::runtime_error("failed writing vector store " + filename);
}

void VectorStore::export_to(std::ostream& os) const
{
    Contents contents;
    _snapshot(contents);

    int64_t num_features = 0;
    for (feature_map_t::const_iterator it = contents.features.begin(); it != contents.features.end(); ++it)
    {
        num_features += it->second.size();
    }

    io::write(os, magic());
    io::write(os, schema_version());
    io::write(os, contents.meta);
    io::write(os, contents.finalized);
    io::write(os, static_cast<int64_t>(num_features + contents.words.size()));

    for (feature_map_t::const_iterator it = contents.features.begin(); it != contents.features.end(); ++it)
    {
        for (map<string, FeatureVector>::const_iterator fit = it->second.begin(); fit != it->second.end(); ++fit)
        {
            write(os, vector_object_t(fit->second));
        }
    }

    for (word_map_t::const_iterator it = contents.words.begin(); it != contents.words.end(); ++it)
    {
        write(os, vector_object_t(WordVector(it->first.first, it->first.second, it->second->stats)));
    }

    io::write(os, magic());
}

void VectorStore::import_from(const string& filename)
{
    std::ifstream ifs(filename.c_str(), std::ifstream::binary);
    if (!ifs.is_open()) throw CorruptStore("could not open vector store " + filename);

    try
    {
        import_from(ifs);
    }
    catch (const CorruptStore& e)
    {
        throw CorruptStore(filename + ": " + e.what());
    }
}

void VectorStore::import_from(std::istream& is)
{
    Contents contents;

    try
    {
        string m;
        io::read(is, m);
        if (m != magic()) throw io::format_error("not a vector store (bad magic)");

        int32_t version = 0;
        io::read(is, version);
        if (version != schema_version())
        {
            throw io::format_error("unsupported schema version " + boost::lexical_cast<string>(version)
                                   + ", expected " + boost::lexical_cast<string>(schema_version()));
        }

        io::read(is, contents.meta);
        io::read(is, contents.finalized);

        int64_t num_records = 0;
        io::read(is, num_records);
        io::check_count(is, num_records, 1);

        for (int64_t i = 0; i < num_records; i++)
        {
            vector_object_t object;
            read(is, object);

            switch (tag_of(object))
            {
                case tag_feature_vector:
                {
                    const FeatureVector& fv = boost::get<FeatureVector>(object);
                    if (fv.word.empty() || fv.revision.empty() || fv.image_id.empty())
                    {
                        throw io::format_error("feature vector without word, revision or image id");
                    }

                    map<string, FeatureVector>& features = contents.features[word_key_t(fv.word, fv.revision)];
                    if (features.count(fv.image_id))
                    {
                        throw io::format_error("duplicate feature vector (" + fv.word + ", " + fv.revision
                                               + ", " + fv.image_id + ")");
                    }
                    features[fv.image_id] = fv;
                    break;
                }
                case tag_word_vector:
                {
                    const WordVector& wv = boost::get<WordVector>(object);
                    if (wv.word.empty() || wv.revision.empty())
                    {
                        throw io::format_error("word vector without word or revision");
                    }

                    word_key_t key(wv.word, wv.revision);
                    if (contents.words.count(key))
                    {
                        throw io::format_error("duplicate word vector (" + wv.word + ", " + wv.revision + ")");
                    }
                    contents.words[key] = make_shared<Entry>(wv.stats);
                    break;
                }
                case tag_colorgram:
                    throw io::format_error("colorgram records are not part of a vector store");
            }
        }

        string end;
        io::read(is, end);
        if (end != magic()) throw io::format_error("missing end marker");

        if (is.peek() != std::char_traits<char>::eof()) throw io::format_error("trailing data after end marker");
    }
    catch (const std::exception& e)
    {
        throw CorruptStore(string("cannot import vector store: ") + e.what());
    }

    boost::unique_lock<boost::shared_mutex> lock(_mutex);
    std::swap(_contents, contents);
}

void VectorStore::export_json(std::ostream& os) const
{
    Contents contents;
    _snapshot(contents);

    ptree root;

    ptree meta;
    for (strmap_t::const_iterator it = contents.meta.begin(); it != contents.meta.end(); ++it)
    {
        meta.put(ptree::path_type(it->first, '\0'), it->second);
    }
    root.add_child("meta", meta);
    root.add_child("finalized", to_array(vector<string>(contents.finalized.begin(), contents.finalized.end())));

    ptree words;
    for (word_map_t::const_iterator it = contents.words.begin(); it != contents.words.end(); ++it)
    {
        const RunningStats& stats = it->second->stats;

        ptree w;
        w.put("word", it->first.first);
        w.put("revision", it->first.second);
        w.put("count", stats.count());
        w.add_child("mean", to_array(stats.mean()));
        w.add_child("variance", to_array(stats.variance()));
        words.push_back(make_pair("", w));
    }
    root.add_child("words", words);

    ptree features;
    for (feature_map_t::const_iterator it = contents.features.begin(); it != contents.features.end(); ++it)
    {
        for (map<string, FeatureVector>::const_iterator fit = it->second.begin(); fit != it->second.end(); ++fit)
        {
            const FeatureVector& fv = fit->second;

            ptree f;
            f.put("word", fv.word);
            f.put("revision", fv.revision);
            f.put("image_id", fv.image_id);
            f.put("timestamp", fv.timestamp);
            f.add_child("values", to_array(fv.values));
            features.push_back(make_pair("", f));
        }
    }
    root.add_child("features", features);

    boost::property_tree::write_json(os, root);
}

} // namespace w2cv
