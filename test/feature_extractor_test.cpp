/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <descriptors/feature_extractor.hpp>
#include <io/property_writer.hpp>
#include <util/errors.hpp>

using namespace w2cv;

namespace {

/// bins 3, one level: histograms of length 9, one cell
Colorgram small_colorgram()
{
    Colorgram cg(ColorgramShape(3, 1, 2, ColorgramShape::marginal));
    float h[9] = { 0.5f, 0.5f, 0.0f,  0.0f, 1.0f, 0.0f,  0.25f, 0.25f, 0.5f };
    std::copy(h, h + 9, cg.histograms.begin());
    cg.means[0] = 0.1f; cg.means[1] = 0.2f; cg.means[2] = 0.3f;
    cg.variances[0] = 0.01f; cg.variances[1] = 0.02f; cg.variances[2] = 0.03f;
    cg.pixel_counts[0] = 4;
    return cg;
}

} // anonymous namespace

TEST(FeatureExtractor, Layout)
{
    Colorgram cg = small_colorgram();
    FeatureExtractor extractor(ptree(), cg.shape);

    ASSERT_EQ(15u, extractor.length());
    vec_f32_t f = extractor.compute(cg);
    ASSERT_EQ(15u, f.size());

    for (int i = 0; i < 9; i++) EXPECT_EQ(cg.histograms[i], f[i]);
    EXPECT_EQ(0.1f, f[9]);
    EXPECT_EQ(0.2f, f[10]);
    EXPECT_EQ(0.3f, f[11]);
    EXPECT_EQ(0.01f, f[12]);
    EXPECT_EQ(0.02f, f[13]);
    EXPECT_EQ(0.03f, f[14]);
}

TEST(FeatureExtractor, LengthGrowsWithPyramid)
{
    ColorgramShape shape(8, 2, 2, ColorgramShape::marginal);
    FeatureExtractor extractor(ptree(), shape);
    EXPECT_EQ(5u * 24u + 5u * 6u, extractor.length());

    ptree params;
    params.put("features.moments", false);
    FeatureExtractor histogram_only(params, shape);
    EXPECT_EQ(5u * 24u, histogram_only.length());
}

TEST(FeatureExtractor, WaveletIsPaddedToPowerOfTwo)
{
    Colorgram cg = small_colorgram();

    ptree params;
    params.put("features.histogram", false);
    params.put("features.moments", false);
    params.put("features.wavelet_levels", 1);
    FeatureExtractor extractor(params, cg.shape);

    // 9 histogram entries padded to 16
    ASSERT_EQ(16u, extractor.length());
    vec_f32_t f = extractor.compute(cg);
    ASSERT_EQ(16u, f.size());

    const float s = static_cast<float>(1.0 / std::sqrt(2.0));
    EXPECT_NEAR((0.5f + 0.5f) * s, f[0], 1e-6);
    EXPECT_NEAR((0.0f + 0.0f) * s, f[1], 1e-6);
    EXPECT_NEAR((1.0f + 0.0f) * s, f[2], 1e-6);
    EXPECT_NEAR((0.25f + 0.25f) * s, f[3], 1e-6);
    EXPECT_NEAR((0.5f + 0.0f) * s, f[4], 1e-6);
    EXPECT_NEAR((0.5f - 0.5f) * s, f[8], 1e-6);
    EXPECT_NEAR((0.0f - 0.0f) * s, f[9], 1e-6);
    EXPECT_NEAR((1.0f - 0.0f) * s, f[10], 1e-6);
    EXPECT_NEAR((0.5f - 0.0f) * s, f[12], 1e-6);

    // energy is preserved
    double e_in = 0, e_out = 0;
    for (int i = 0; i < 9; i++) e_in += cg.histograms[i] * cg.histograms[i];
    for (int i = 0; i < 16; i++) e_out += f[i] * f[i];
    EXPECT_NEAR(e_in, e_out, 1e-5);
}

TEST(FeatureExtractor, Deterministic)
{
    Colorgram cg = small_colorgram();
    ptree params;
    params.put("features.wavelet_levels", 3);
    FeatureExtractor extractor(params, cg.shape);
    EXPECT_EQ(extractor.compute(cg), extractor.compute(cg));
}

TEST(FeatureExtractor, RejectsOtherShape)
{
    FeatureExtractor extractor(ptree(), ColorgramShape(8, 1, 2, ColorgramShape::marginal));
    EXPECT_THROW(extractor.compute(small_colorgram()), DimensionMismatch);

    Colorgram broken = small_colorgram();
    broken.means.pop_back();
    FeatureExtractor other(ptree(), broken.shape);
    EXPECT_THROW(other.compute(broken), DimensionMismatch);
}

TEST(FeatureExtractor, RejectsInvalidParameters)
{
    ColorgramShape shape = small_colorgram().shape;

    ptree none;
    none.put("features.histogram", false);
    none.put("features.moments", false);
    EXPECT_THROW(FeatureExtractor e(none, shape), std::invalid_argument);

    ptree negative;
    negative.put("features.wavelet_levels", -1);
    EXPECT_THROW(FeatureExtractor e(negative, shape), std::invalid_argument);
}

TEST(FeatureExtractor, ConfiguredTransformMustBeLoaded)
{
    ptree params;
    params.put("features.transform", "pca.transform");
    EXPECT_THROW(FeatureExtractor e(params, small_colorgram().shape), MissingTransform);
}

TEST(FeatureExtractor, TransformMustFit)
{
    cv::Mat_<float> m = cv::Mat_<float>::eye(2, 4);
    shared_ptr<const LinearTransform> transform = make_shared<LinearTransform>(m, vec_f32_t(4, 0.0f));
    EXPECT_THROW(FeatureExtractor e(ptree(), small_colorgram().shape, transform), DimensionMismatch);
}

TEST(FeatureExtractor, AppliesTransform)
{
    Colorgram cg = small_colorgram();

    // pick mean r and variance b out of the 15 base values
    cv::Mat_<float> m = cv::Mat_<float>::zeros(2, 15);
    m(0, 9) = 1.0f;
    m(1, 14) = 2.0f;
    vec_f32_t offset(15, 0.0f);
    offset[9] = 0.1f;

    shared_ptr<const LinearTransform> transform = make_shared<LinearTransform>(m, offset);
    FeatureExtractor extractor(ptree(), cg.shape, transform);
    EXPECT_EQ(15u, extractor.base_length());
    ASSERT_EQ(2u, extractor.length());

    vec_f32_t f = extractor.compute(cg);
    ASSERT_EQ(2u, f.size());
    EXPECT_NEAR(0.0f, f[0], 1e-6);
    EXPECT_NEAR(0.06f, f[1], 1e-6);
}


TEST(LinearTransform, Apply)
{
    cv::Mat_<float> m(2, 3);
    m(0, 0) = 1; m(0, 1) = 2; m(0, 2) = 3;
    m(1, 0) = 0; m(1, 1) = 1; m(1, 2) = 0;
    vec_f32_t offset(3, 1.0f);

    LinearTransform t(m, offset);
    EXPECT_EQ(3u, t.input_size());
    EXPECT_EQ(2u, t.output_size());

    vec_f32_t x(3);
    x[0] = 2; x[1] = 3; x[2] = 4;
    vec_f32_t y = t.apply(x);
    ASSERT_EQ(2u, y.size());
    EXPECT_FLOAT_EQ(1 + 4 + 9, y[0]);
    EXPECT_FLOAT_EQ(2, y[1]);

    EXPECT_THROW(t.apply(vec_f32_t(2)), DimensionMismatch);
}

TEST(LinearTransform, RejectsOffsetOfWrongLength)
{
    cv::Mat_<float> m = cv::Mat_<float>::eye(2, 3);
    EXPECT_THROW(LinearTransform t(m, vec_f32_t(2)), DimensionMismatch);
}

TEST(LinearTransform, SaveAndLoad)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    string filename = dir.path().toStdString() + "/pca.transform";

    cv::Mat_<float> m(2, 3);
    for (int i = 0; i < 6; i++) m(i / 3, i % 3) = 0.5f * i;
    vec_f32_t offset(3);
    offset[0] = -1; offset[1] = 0; offset[2] = 1;

    LinearTransform(m, offset).save(filename);
    shared_ptr<LinearTransform> loaded = LinearTransform::load(filename);

    ASSERT_TRUE(loaded);
    EXPECT_EQ(offset, loaded->offset());
    ASSERT_EQ(2, loaded->matrix().rows);
    ASSERT_EQ(3, loaded->matrix().cols);
    for (int i = 0; i < 6; i++) EXPECT_EQ(m(i / 3, i % 3), loaded->matrix()(i / 3, i % 3));
}

TEST(LinearTransform, LoadFailures)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    string path = dir.path().toStdString();

    EXPECT_THROW(LinearTransform::load(path + "/absent.transform"), MissingTransform);

    // an offset but no rows
    write_property(vec_vec_f32_t(1, vec_f32_t(3, 0.0f)), path + "/norows.transform");
    EXPECT_THROW(LinearTransform::load(path + "/norows.transform"), MissingTransform);

    // a row of the wrong length
    vec_vec_f32_t ragged;
    ragged.push_back(vec_f32_t(3, 0.0f));
    ragged.push_back(vec_f32_t(2, 1.0f));
    write_property(ragged, path + "/ragged.transform");
    EXPECT_THROW(LinearTransform::load(path + "/ragged.transform"), MissingTransform);
}
