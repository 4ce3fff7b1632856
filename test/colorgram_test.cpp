/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <numeric>
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include <color/converter.hpp>
#include <descriptors/colorgram.hpp>
#include <io/io.hpp>
#include <store/vector_object.hpp>
#include <util/errors.hpp>

#include "fake_color_table.hpp"

using namespace w2cv;

namespace {

ptree unit_range(int bins)
{
    ptree params;
    params.put("colorgram.bins", bins);
    for (int c = 0; c < 3; c++)
    {
        params.put("colorgram.range.c" + boost::lexical_cast<string>(c) + ".min", 0);
        params.put("colorgram.range.c" + boost::lexical_cast<string>(c) + ".max", 1);
    }
    return params;
}

float sum(const float* begin, size_t n)
{
    return std::accumulate(begin, begin + n, 0.0f);
}

} // anonymous namespace

class ColorgramTest : public ::testing::Test
{
    protected:

    ColorgramTest()
        : table(make_shared<LinearColorTable>())
        , converter(table)
    {}

    Colorgram compute(const ptree& params, const cv::Mat& image) const
    {
        ColorgramGenerator generator(params, *table);
        return generator.compute(converter.convert(image));
    }

    shared_ptr<LinearColorTable> table;
    ColorConverter               converter;
};

TEST_F(ColorgramTest, DefaultShape)
{
    ColorgramGenerator generator(ptree(), *table);

    EXPECT_EQ(8u, generator.shape().bins);
    EXPECT_EQ(1u, generator.shape().levels);
    EXPECT_EQ(2u, generator.shape().grid);
    EXPECT_EQ(ColorgramShape::marginal, generator.shape().mode);
    EXPECT_EQ(1u, generator.shape().num_cells());
    EXPECT_EQ(24u, generator.shape().histogram_size());

    // defaults are written back
    EXPECT_EQ(8, generator.parameters().get<int>("colorgram.bins"));
    EXPECT_EQ("marginal", generator.parameters().get<string>("colorgram.mode"));
}

TEST_F(ColorgramTest, RangeDefaultsToTable)
{
    ColorgramGenerator generator(ptree(), *table);
    for (int c = 0; c < 3; c++)
    {
        ASSERT_EQ(9u, generator.bin_edges(c).size());
        EXPECT_DOUBLE_EQ(table->channel_min(c), generator.bin_edges(c).front());
        EXPECT_DOUBLE_EQ(table->channel_max(c), generator.bin_edges(c).back());
    }
}

TEST_F(ColorgramTest, BoundaryGoesToLowerBin)
{
    ColorgramGenerator generator(unit_range(4), *table);

    EXPECT_EQ(0u, generator.bin(0, 0.0f));
    EXPECT_EQ(0u, generator.bin(0, 0.25f));
    EXPECT_EQ(1u, generator.bin(0, 0.26f));
    EXPECT_EQ(1u, generator.bin(0, 0.5f));
    EXPECT_EQ(2u, generator.bin(0, 0.75f));
    EXPECT_EQ(3u, generator.bin(0, 0.76f));
    EXPECT_EQ(3u, generator.bin(0, 1.0f));

    // out of range values clamp
    EXPECT_EQ(0u, generator.bin(1, -3.0f));
    EXPECT_EQ(3u, generator.bin(2, 7.0f));
}

TEST_F(ColorgramTest, BoundaryPixelsGoToLowerBin)
{
    // identity table and range [0,256): bin boundaries at 64, 128, 192
    LinearColorTable identity(1.0f);
    ColorConverter conv(make_shared<LinearColorTable>(1.0f));

    ptree params;
    params.put("colorgram.bins", 4);
    for (int c = 0; c < 3; c++)
    {
        params.put("colorgram.range.c" + boost::lexical_cast<string>(c) + ".min", 0);
        params.put("colorgram.range.c" + boost::lexical_cast<string>(c) + ".max", 256);
    }

    ColorgramGenerator generator(params, identity);
    Colorgram cg = generator.compute(conv.convert(solid_image(2, 2, 128, 129, 64)));

    const float* h = cg.histogram(0);
    EXPECT_FLOAT_EQ(1.0f, h[1]);        // r = 128 -> bin 1
    EXPECT_FLOAT_EQ(1.0f, h[4 + 2]);    // g = 129 -> bin 2
    EXPECT_FLOAT_EQ(1.0f, h[8 + 0]);    // b = 64  -> bin 0
}

TEST_F(ColorgramTest, UniformImage)
{
    Colorgram cg = compute(ptree(), solid_image(5, 7, 255, 0, 0));

    ASSERT_TRUE(cg.consistent());
    ASSERT_EQ(1u, cg.pixel_counts.size());
    EXPECT_EQ(35u, cg.pixel_counts[0]);

    // exactly one populated bin per channel
    const float* h = cg.histogram(0);
    for (int c = 0; c < 3; c++)
    {
        int populated = 0;
        for (int b = 0; b < 8; b++) if (h[c * 8 + b] != 0.0f) populated++;
        EXPECT_EQ(1, populated);
        EXPECT_FLOAT_EQ(1.0f, sum(h + c * 8, 8));
    }
    EXPECT_FLOAT_EQ(1.0f, h[7]);
    EXPECT_FLOAT_EQ(1.0f, h[8]);
    EXPECT_FLOAT_EQ(1.0f, h[16]);

    EXPECT_FLOAT_EQ(1.0f, cg.means[0]);
    EXPECT_FLOAT_EQ(0.0f, cg.means[1]);
    EXPECT_FLOAT_EQ(0.0f, cg.means[2]);
    for (int c = 0; c < 3; c++) EXPECT_EQ(0.0f, cg.variances[c]);
}

TEST_F(ColorgramTest, MeanAndVariance)
{
    // half black, half white in channel r: mean 0.5, population variance 0.25
    mat_8uc3_t image(2, 2, cv::Vec3b(0, 0, 0));
    image(0, 0) = cv::Vec3b(0, 0, 255);
    image(1, 1) = cv::Vec3b(0, 0, 255);

    Colorgram cg = compute(ptree(), image);
    EXPECT_NEAR(0.5, cg.means[0], 1e-6);
    EXPECT_NEAR(0.25, cg.variances[0], 1e-6);
    EXPECT_FLOAT_EQ(0.5f, cg.histogram(0)[0]);
    EXPECT_FLOAT_EQ(0.5f, cg.histogram(0)[7]);
}

TEST_F(ColorgramTest, PyramidCells)
{
    ptree params;
    params.put("colorgram.levels", 2);

    // quadrants: red, green / blue, white
    mat_8uc3_t image(4, 4);
    for (int y = 0; y < 4; y++)
    for (int x = 0; x < 4; x++)
    {
        if      (y < 2 && x < 2) image(y, x) = cv::Vec3b(0, 0, 255);
        else if (y < 2)          image(y, x) = cv::Vec3b(0, 255, 0);
        else if (x < 2)          image(y, x) = cv::Vec3b(255, 0, 0);
        else                     image(y, x) = cv::Vec3b(255, 255, 255);
    }

    Colorgram cg = compute(params, image);
    ASSERT_EQ(5u, cg.shape.num_cells());
    ASSERT_TRUE(cg.consistent());

    EXPECT_EQ(16u, cg.pixel_counts[0]);
    for (int cell = 1; cell < 5; cell++) EXPECT_EQ(4u, cg.pixel_counts[cell]);

    // level 1 is row-major: top-left, top-right, bottom-left, bottom-right
    EXPECT_FLOAT_EQ(1.0f, cg.means[1 * 3 + 0]);
    EXPECT_FLOAT_EQ(0.0f, cg.means[1 * 3 + 1]);
    EXPECT_FLOAT_EQ(1.0f, cg.means[2 * 3 + 1]);
    EXPECT_FLOAT_EQ(1.0f, cg.means[3 * 3 + 2]);
    EXPECT_FLOAT_EQ(0.0f, cg.means[3 * 3 + 0]);
    for (int c = 0; c < 3; c++) EXPECT_FLOAT_EQ(1.0f, cg.means[4 * 3 + c]);

    // level 0 covers everything
    EXPECT_FLOAT_EQ(0.5f, cg.means[0]);
    EXPECT_FLOAT_EQ(0.5f, cg.histogram(0)[7]);
}

TEST_F(ColorgramTest, ImageSmallerThanGrid)
{
    ptree params;
    params.put("colorgram.levels", 2);

    Colorgram cg = compute(params, solid_image(1, 1, 10, 20, 30));
    ASSERT_TRUE(cg.consistent());

    EXPECT_EQ(1u, cg.pixel_counts[0]);
    EXPECT_EQ(1u, cg.pixel_counts[1]);
    for (int cell = 2; cell < 5; cell++)
    {
        EXPECT_EQ(0u, cg.pixel_counts[cell]);
        EXPECT_FLOAT_EQ(0.0f, sum(cg.histogram(cell), cg.shape.histogram_size()));
        for (int c = 0; c < 3; c++) EXPECT_EQ(0.0f, cg.means[cell * 3 + c]);
    }
}

TEST_F(ColorgramTest, JointHistogramSumsToOne)
{
    ptree params;
    params.put("colorgram.mode", "joint");
    params.put("colorgram.bins", 4);

    mat_8uc3_t image(8, 8);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(256));

    Colorgram cg = compute(params, image);
    ASSERT_EQ(64u, cg.shape.histogram_size());
    EXPECT_NEAR(1.0f, sum(cg.histogram(0), 64), 1e-5);
}

TEST_F(ColorgramTest, RejectsInvalidParameters)
{
    ptree bins;
    bins.put("colorgram.bins", 0);
    EXPECT_THROW(ColorgramGenerator g(bins, *table), std::invalid_argument);

    ptree mode;
    mode.put("colorgram.mode", "conditional");
    EXPECT_THROW(ColorgramGenerator g(mode, *table), std::invalid_argument);

    ptree range;
    range.put("colorgram.range.c1.min", 0.5);
    range.put("colorgram.range.c1.max", 0.5);
    EXPECT_THROW(ColorgramGenerator g(range, *table), std::invalid_argument);
}

TEST(ColorgramShape, Valid)
{
    EXPECT_TRUE(ColorgramShape(8, 1, 2, ColorgramShape::marginal).valid());
    EXPECT_TRUE(ColorgramShape(8, 4, 2, ColorgramShape::joint).valid());
    EXPECT_FALSE(ColorgramShape(0, 1, 2, ColorgramShape::marginal).valid());
    EXPECT_FALSE(ColorgramShape(8, 0, 2, ColorgramShape::marginal).valid());
    EXPECT_FALSE(ColorgramShape(8, 1, 0, ColorgramShape::marginal).valid());

    // grid^(2*(levels-1)) alone is far beyond size_t here
    EXPECT_FALSE(ColorgramShape(8, 33, 2, ColorgramShape::marginal).valid());
    EXPECT_FALSE(ColorgramShape(8, 30, 64, ColorgramShape::marginal).valid());
    EXPECT_FALSE(ColorgramShape(1024, 1, 1, ColorgramShape::joint).valid());

    // a single level of one cell with a very large histogram
    EXPECT_TRUE(ColorgramShape(256, 1, 1, ColorgramShape::joint).valid());
    EXPECT_FALSE(ColorgramShape(512, 1, 1, ColorgramShape::joint).valid());
}

TEST_F(ColorgramTest, RejectsTooManyValues)
{
    ptree levels;
    levels.put("colorgram.levels", 33);
    EXPECT_THROW(ColorgramGenerator g(levels, *table), std::invalid_argument);

    ptree grid;
    grid.put("colorgram.levels", 30);
    grid.put("colorgram.grid", 64);
    EXPECT_THROW(ColorgramGenerator g(grid, *table), std::invalid_argument);

    ptree joint;
    joint.put("colorgram.bins", 1024);
    joint.put("colorgram.mode", "joint");
    EXPECT_THROW(ColorgramGenerator g(joint, *table), std::invalid_argument);
}

TEST(ColorgramRecord, RejectsOversizedShape)
{
    std::stringstream ss;
    io::write(ss, int32_t(8));     // bins
    io::write(ss, int32_t(33));    // levels
    io::write(ss, int32_t(2));     // grid
    io::write(ss, int8_t(ColorgramShape::marginal));

    Colorgram v;
    EXPECT_THROW(read(ss, v), io::format_error);
}

TEST_F(ColorgramTest, RejectsEmptyImage)
{
    ColorgramGenerator generator(ptree(), *table);
    EXPECT_THROW(generator.compute(mat_32fc3_t()), InvalidPixelRange);
}
