/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <aggregate/aggregator.hpp>
#include <io/io.hpp>
#include <store/vector_object.hpp>
#include <store/vector_store.hpp>
#include <util/errors.hpp>

using namespace w2cv;

namespace {

FeatureVector feature(const string& word, const string& revision, const string& id, float a, float b)
{
    FeatureVector v;
    v.word = word;
    v.revision = revision;
    v.image_id = id;
    v.timestamp = 1349870400000LL;
    v.values.push_back(a);
    v.values.push_back(b);
    return v;
}

/// Stores the feature vector and contributes it to its word vector
void add(VectorStore& store, const FeatureVector& v)
{
    store.put(v);
    Aggregator(store).contribute(v);
}

/// Header of a store file with the given record count
void write_header(std::ostream& os, int64_t num_records, int32_t version = VectorStore::schema_version())
{
    io::write(os, VectorStore::magic());
    io::write(os, version);
    io::write(os, strmap_t());
    io::write(os, set<string>());
    io::write(os, num_records);
}

string exported(const VectorStore& store)
{
    std::stringstream ss;
    store.export_to(ss);
    return ss.str();
}

} // anonymous namespace

class VectorStoreTest : public ::testing::Test
{
    protected:

    void SetUp()
    {
        add(store, feature("ocean", "r1", "a.jpg", 0.1f, 0.9f));
        add(store, feature("ocean", "r1", "b.jpg", 0.3f, 0.7f));
        add(store, feature("forest", "r1", "c.jpg", 0.5f, 0.2f));
        add(store, feature("ocean", "r2", "d.jpg", 0.2f, 0.8f));
        store.set_meta("source", "unit test");
    }

    /// Import must fail and leave the store as it was
    void expect_corrupt(const string& data)
    {
        string before = exported(store);
        std::istringstream is(data);
        EXPECT_THROW(store.import_from(is), CorruptStore);
        EXPECT_EQ(before, exported(store));
    }

    VectorStore store;
};

TEST_F(VectorStoreTest, Listing)
{
    EXPECT_EQ(3u, store.num_word_vectors());
    EXPECT_EQ(4u, store.num_feature_vectors());

    vector<string> revisions = store.list_revisions();
    ASSERT_EQ(2u, revisions.size());
    EXPECT_EQ("r1", revisions[0]);
    EXPECT_EQ("r2", revisions[1]);

    vector<string> words = store.list_words("r1");
    ASSERT_EQ(2u, words.size());
    EXPECT_EQ("forest", words[0]);
    EXPECT_EQ("ocean", words[1]);
    EXPECT_EQ(1u, store.list_words("r2").size());
    EXPECT_EQ(2u, store.list_words().size());

    vector<FeatureVector> ocean = store.features("ocean", "r1");
    ASSERT_EQ(2u, ocean.size());
    EXPECT_EQ("a.jpg", ocean[0].image_id);
    EXPECT_EQ("b.jpg", ocean[1].image_id);
}

TEST_F(VectorStoreTest, Get)
{
    optional<WordVector> wv = store.get("ocean", "r1");
    ASSERT_TRUE(wv);
    EXPECT_EQ(2u, wv->count());
    EXPECT_NEAR(0.2, wv->mean()[0], 1e-6);

    EXPECT_FALSE(store.get("ocean", "r3"));
    EXPECT_FALSE(store.get("desert", "r1"));

    optional<FeatureVector> fv = store.get("ocean", "r1", "b.jpg");
    ASSERT_TRUE(fv);
    EXPECT_EQ(0.3f, fv->values[0]);
    EXPECT_FALSE(store.get("ocean", "r1", "c.jpg"));
}

TEST_F(VectorStoreTest, PutValidates)
{
    EXPECT_THROW(store.put(feature("", "r1", "x.jpg", 0, 0)), std::invalid_argument);
    EXPECT_THROW(store.put(feature("ocean", "r1", "", 0, 0)), std::invalid_argument);
    EXPECT_THROW(store.put(WordVector("ocean", "r1", RunningStats(2))), std::invalid_argument);
}

TEST_F(VectorStoreTest, RoundTrip)
{
    std::stringstream ss;
    store.export_to(ss);

    VectorStore copy;
    copy.import_from(ss);

    EXPECT_EQ(store.num_word_vectors(), copy.num_word_vectors());
    EXPECT_EQ(store.num_feature_vectors(), copy.num_feature_vectors());
    EXPECT_EQ(store.meta(), copy.meta());
    EXPECT_EQ("unit test", copy.meta()["source"]);

    WordVector a = *store.get("ocean", "r1");
    WordVector b = *copy.get("ocean", "r1");
    EXPECT_EQ(a.count(), b.count());
    EXPECT_EQ(a.mean(), b.mean());
    EXPECT_EQ(a.stats.m2(), b.stats.m2());

    FeatureVector fa = *store.get("forest", "r1", "c.jpg");
    FeatureVector fb = *copy.get("forest", "r1", "c.jpg");
    EXPECT_EQ(fa.values, fb.values);
    EXPECT_EQ(fa.timestamp, fb.timestamp);

    // export is deterministic
    EXPECT_EQ(exported(store), exported(copy));
}

TEST_F(VectorStoreTest, RoundTripThroughFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    string filename = dir.path().toStdString() + "/test.store";

    store.finalize("r1");
    store.export_to(filename);

    VectorStore copy;
    copy.import_from(filename);
    EXPECT_TRUE(copy.is_finalized("r1"));
    EXPECT_FALSE(copy.is_finalized("r2"));
    EXPECT_EQ(exported(store), exported(copy));

    EXPECT_THROW(copy.import_from(dir.path().toStdString() + "/absent.store"), CorruptStore);
    EXPECT_EQ(exported(store), exported(copy));
}

TEST_F(VectorStoreTest, ImportReplacesContent)
{
    VectorStore other;
    add(other, feature("sky", "r9", "z.jpg", 1, 1));

    std::stringstream ss;
    other.export_to(ss);
    store.import_from(ss);

    EXPECT_EQ(1u, store.num_word_vectors());
    EXPECT_FALSE(store.get("ocean", "r1"));
    EXPECT_TRUE(store.get("sky", "r9"));
}

TEST_F(VectorStoreTest, RejectsCorruptData)
{
    string valid = exported(store);

    expect_corrupt("");
    expect_corrupt("this is not a vector store");
    expect_corrupt(valid.substr(0, valid.size() / 2));
    expect_corrupt(valid.substr(0, valid.size() - 1));
    expect_corrupt(valid + "x");

    std::ostringstream bad_magic;
    io::write(bad_magic, string("other-store"));
    expect_corrupt(bad_magic.str() + valid.substr(VectorStore::magic().size() + 4));
}

TEST_F(VectorStoreTest, RejectsOtherSchemaVersion)
{
    std::ostringstream os;
    write_header(os, 0, VectorStore::schema_version() + 1);
    io::write(os, VectorStore::magic());
    expect_corrupt(os.str());

    // the same without the version change is a valid, empty store
    std::ostringstream empty;
    write_header(empty, 0);
    io::write(empty, VectorStore::magic());
    std::istringstream is(empty.str());
    store.import_from(is);
    EXPECT_EQ(0u, store.num_word_vectors());
}

TEST_F(VectorStoreTest, RejectsBadRecords)
{
    // record count larger than the records present
    {
        std::ostringstream os;
        write_header(os, 2);
        write(os, vector_object_t(feature("ocean", "r1", "a.jpg", 0, 0)));
        io::write(os, VectorStore::magic());
        expect_corrupt(os.str());
    }

    // duplicate feature vector
    {
        std::ostringstream os;
        write_header(os, 2);
        write(os, vector_object_t(feature("ocean", "r1", "a.jpg", 0, 0)));
        write(os, vector_object_t(feature("ocean", "r1", "a.jpg", 1, 1)));
        io::write(os, VectorStore::magic());
        expect_corrupt(os.str());
    }

    // colorgrams are never part of a store
    {
        std::ostringstream os;
        write_header(os, 1);
        write(os, vector_object_t(Colorgram()));
        io::write(os, VectorStore::magic());
        expect_corrupt(os.str());
    }

    // unknown record tag
    {
        std::ostringstream os;
        write_header(os, 1);
        io::write(os, static_cast<int8_t>(7));
        io::write(os, VectorStore::magic());
        expect_corrupt(os.str());
    }

    // word vector whose variance does not match its moments
    {
        std::ostringstream os;
        write_header(os, 1);
        io::write(os, static_cast<int8_t>(tag_word_vector));
        io::write(os, string("ocean"));
        io::write(os, string("r1"));
        io::write(os, static_cast<uint64_t>(2));
        io::write(os, vec_f64_t(1, 0.5));   // mean
        io::write(os, vec_f64_t(1, 0.3));   // variance
        io::write(os, vec_f64_t(1, 0.2));   // m2, variance should be 0.1
        io::write(os, VectorStore::magic());
        expect_corrupt(os.str());
    }
}

TEST_F(VectorStoreTest, FinalizedRevisionIsImmutable)
{
    store.finalize("r1");
    store.finalize("r1");
    EXPECT_TRUE(store.is_finalized("r1"));
    EXPECT_FALSE(store.is_finalized("r2"));

    EXPECT_THROW(store.put(feature("ocean", "r1", "e.jpg", 0, 0)), RevisionFinalized);
    EXPECT_THROW(Aggregator(store).contribute(feature("ocean", "r1", "e.jpg", 0, 0)), RevisionFinalized);
    EXPECT_THROW(store.merge_revision("r2", "r1"), RevisionFinalized);
    EXPECT_EQ(2u, store.get("ocean", "r1")->count());
    EXPECT_EQ(4u, store.num_feature_vectors());

    // a finalized revision can still be the source of a merge
    EXPECT_EQ(2u, store.merge_revision("r1", "r2"));
}

TEST_F(VectorStoreTest, MergeRevision)
{
    EXPECT_EQ(2u, store.merge_revision("r1", "r2"));

    WordVector ocean = *store.get("ocean", "r2");
    EXPECT_EQ(3u, ocean.count());
    EXPECT_NEAR((0.1 + 0.3 + 0.2) / 3.0, ocean.mean()[0], 1e-6);
    EXPECT_EQ(1u, store.get("forest", "r2")->count());

    // the source is untouched, feature vectors are copied with the new revision
    EXPECT_EQ(2u, store.get("ocean", "r1")->count());
    optional<FeatureVector> copied = store.get("ocean", "r2", "a.jpg");
    ASSERT_TRUE(copied);
    EXPECT_EQ("r2", copied->revision);
    EXPECT_EQ(7u, store.num_feature_vectors());

    EXPECT_THROW(store.merge_revision("r1", "r1"), std::invalid_argument);
    EXPECT_EQ(0u, store.merge_revision("r7", "r2"));
}

TEST_F(VectorStoreTest, MergeRevisionIsAllOrNothing)
{
    // forest in r3 has another length than forest in r1
    FeatureVector longer = feature("forest", "r3", "f.jpg", 1, 1);
    longer.values.push_back(1);
    add(store, longer);
    add(store, feature("ocean", "r3", "g.jpg", 1, 1));

    string before = exported(store);
    EXPECT_THROW(store.merge_revision("r3", "r1"), DimensionMismatch);
    EXPECT_EQ(before, exported(store));
}

TEST_F(VectorStoreTest, MergeStore)
{
    VectorStore other;
    add(other, feature("ocean", "r1", "x.jpg", 0.2f, 0.8f));
    add(other, feature("desert", "r1", "y.jpg", 0.9f, 0.1f));

    store.merge_store(other);

    EXPECT_EQ(3u, store.get("ocean", "r1")->count());
    EXPECT_NEAR(0.2, store.get("ocean", "r1")->mean()[0], 1e-6);
    EXPECT_EQ(1u, store.get("desert", "r1")->count());
    EXPECT_TRUE(store.get("desert", "r1", "y.jpg"));
    EXPECT_EQ(6u, store.num_feature_vectors());

    // other is unchanged
    EXPECT_EQ(1u, other.get("ocean", "r1")->count());

    EXPECT_THROW(store.merge_store(store), std::invalid_argument);
}

TEST_F(VectorStoreTest, MergeStoreTakesOverFinalizedRevisions)
{
    VectorStore other;
    add(other, feature("ocean", "r5", "x.jpg", 0.2f, 0.8f));
    other.finalize("r5");

    store.merge_store(other);
    EXPECT_TRUE(store.is_finalized("r5"));
    EXPECT_EQ(1u, store.get("ocean", "r5")->count());

    // merging it a second time would change a finalized revision
    string before = exported(store);
    EXPECT_THROW(store.merge_store(other), RevisionFinalized);
    EXPECT_EQ(before, exported(store));

    // same for a revision finalized on our side only
    store.finalize("r2");
    VectorStore late;
    add(late, feature("ocean", "r2", "z.jpg", 0, 0));
    EXPECT_THROW(store.merge_store(late), RevisionFinalized);
    EXPECT_EQ(1u, store.get("ocean", "r2")->count());
}

TEST_F(VectorStoreTest, ExportJson)
{
    std::stringstream ss;
    store.export_json(ss);

    ptree root;
    boost::property_tree::read_json(ss, root);

    EXPECT_EQ("unit test", root.get<string>("meta.source"));
    EXPECT_EQ(3u, root.get_child("words").size());
    EXPECT_EQ(4u, root.get_child("features").size());

    const ptree& first = root.get_child("words").begin()->second;
    EXPECT_EQ("forest", first.get<string>("word"));
    EXPECT_EQ(1, first.get<int>("count"));
    EXPECT_EQ(2u, first.get_child("mean").size());
}
