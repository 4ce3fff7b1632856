/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef STORE__VECTOR_STORE_HPP
#define STORE__VECTOR_STORE_HPP

#include <istream>
#include <ostream>

#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "../util/types.hpp"
#include "../descriptors/feature_vector.hpp"
#include "../aggregate/word_vector.hpp"

namespace w2cv {

/**
 * @ingroup store
 * @brief Container of all per-image and per-word vectors of a computation.
 *
 * Word vectors are keyed by (word, revision), feature vectors by (word, revision, image id).
 * A revision can be finalized, after that none of its vectors can be changed anymore.
 *
 * The store is safe to use from several threads. The maps are guarded by a reader/writer
 * lock, every word vector additionally has a mutex of its own, so that modify() calls for
 * different words run concurrently while calls for the same word are serialized.
 *
 * Binary layout written by export_to():
 * @code
 * string              magic ("w2cv-store")
 * int32               schema version
 * map<string,string>  meta data
 * set<string>         finalized revisions
 * int64               number of records
 * vector_object_t     records (feature vectors first, then word vectors)
 * string              magic
 * @endcode
 */
class VectorStore : boost::noncopyable
{
    public:

    typedef boost::function<void (RunningStats&)> modifier_fn;

    static const string& magic();
    static int32_t schema_version();

    VectorStore();

    /// Stores v, replacing a feature vector with the same key
    /// @throws RevisionFinalized if v.revision is finalized
    void put(const FeatureVector& v);

    /// Stores v, replacing a word vector with the same key
    /// @throws RevisionFinalized if v.revision is finalized
    /// @throws std::invalid_argument if v.count() == 0
    void put(const WordVector& v);

    optional<WordVector> get(const string& word, const string& revision) const;
    optional<FeatureVector> get(const string& word, const string& revision, const string& image_id) const;

    /// All feature vectors of (word, revision), ordered by image id
    vector<FeatureVector> features(const string& word, const string& revision) const;

    /// All words having a word vector in revision, sorted
    vector<string> list_words(const string& revision) const;

    /// All words having a word vector in any revision, sorted
    vector<string> list_words() const;

    /// All revisions that hold any vector or have been finalized, sorted
    vector<string> list_revisions() const;

    size_t num_word_vectors() const;
    size_t num_feature_vectors() const;

    /**
     * @brief Applies fn to the running statistics of (word, revision) and returns the result.
     *
     * fn works on a copy of the statistics which replaces the stored ones only if fn
     * returns normally, an exception thrown by fn leaves the store unchanged. A missing
     * entry is passed in as empty statistics and only created on success.
     *
     * @throws RevisionFinalized if revision is finalized
     */
    WordVector modify(const string& word, const string& revision, const modifier_fn& fn);

    /**
     * @brief Stores the feature vector v and applies fn to the running statistics of
     * (v.word, v.revision), both in one step.
     *
     * Either the feature vector and the statistics are both changed or none of them,
     * so the word vector always summarizes exactly the stored feature vectors that
     * were added this way. An exception thrown by fn leaves the store unchanged.
     *
     * @throws DuplicateImage if (v.word, v.revision) already holds v.image_id
     * @throws RevisionFinalized if v.revision is finalized
     */
    WordVector add(const FeatureVector& v, const modifier_fn& fn);

    /// Marks revision as immutable, finalizing a revision twice is a no-op
    void finalize(const string& revision);
    bool is_finalized(const string& revision) const;

    /**
     * @brief Merges all vectors of revision source into revision target.
     *
     * Word vectors are combined with merge(), feature vectors are copied. source is
     * left unchanged.
     *
     * @return number of word vectors merged
     * @throws RevisionFinalized if target is finalized
     */
    size_t merge_revision(const string& source, const string& target);

    /**
     * @brief Merges all vectors of other into this store.
     *
     * Word vectors present in both stores are combined with merge(), feature vectors
     * of other replace ours. Finalized revisions of other become finalized here. A
     * finalized revision is only ever taken over as a whole, into a store that does
     * not hold any vector of it yet.
     *
     * @throws RevisionFinalized if other holds vectors of a revision that is finalized in
     * either store and this store already holds vectors of that revision, nothing is
     * merged in that case
     */
    void merge_store(const VectorStore& other);

    strmap_t meta() const;
    void set_meta(const string& key, const string& value);

    /// @throws std::runtime_error if the file cannot be written
    void export_to(const string& filename) const;
    void export_to(std::ostream& os) const;

    /**
     * @brief Replaces the content of the store by the content of a file written by export_to().
     *
     * Either the whole file is imported or, in case of any error, the store is left unchanged.
     *
     * @throws CorruptStore if the file is absent, of another schema version or malformed in any way
     */
    void import_from(const string& filename);
    void import_from(std::istream& is);

    /// Human readable dump of the whole store
    void export_json(std::ostream& os) const;

    private:

    typedef pair<string, string> word_key_t;    // (word, revision)

    struct Entry
    {
        explicit Entry(const RunningStats& s) : stats(s) {}
        boost::mutex mutex;
        RunningStats stats;
    };

    typedef map<word_key_t, shared_ptr<Entry> >          word_map_t;
    typedef map<word_key_t, map<string, FeatureVector> > feature_map_t;

    struct Contents
    {
        word_map_t    words;
        feature_map_t features;
        set<string>   finalized;
        strmap_t      meta;
    };

    void _check_not_finalized(const string& revision) const;
    void _snapshot(Contents& contents) const;
    bool _has_revision(const string& revision) const;

    Contents                    _contents;
    mutable boost::shared_mutex _mutex;
};

} // namespace w2cv

#endif // STORE__VECTOR_STORE_HPP
