/*
 * PixelForge
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include <PixelForge/Preprocessing/Filters.hpp>

#include "../Fixture.hpp"

using namespace PixelForge::Preprocessing;
using PixelForge::Imaging::PixelBuffer;
using PixelForge::Imaging::Rgba;

namespace {

PixelBuffer grayRamp()
{
	PixelBuffer buffer(3, 1);
	buffer.set(0, 0, {0, 0, 0, 255});
	buffer.set(1, 0, {90, 90, 90, 255});
	buffer.set(2, 0, {180, 180, 180, 255});
	return buffer;
}

} // anonymous namespace

TEST(BoxBlurTest, AveragesInBoundsNeighboursOnly)
{
	PixelBuffer buffer = grayRamp();
	boxBlur(buffer, 1.0);

	EXPECT_EQ(buffer.at(0, 0), (Rgba{45, 45, 45, 255}));
	EXPECT_EQ(buffer.at(1, 0), (Rgba{90, 90, 90, 255}));
	EXPECT_EQ(buffer.at(2, 0), (Rgba{135, 135, 135, 255}));
}

TEST(BoxBlurTest, BlursAlphaToo)
{
	PixelBuffer buffer(2, 1, Fixture::BLACK);
	buffer.setAlpha(1, 0, 0);
	boxBlur(buffer, 1.0);

	EXPECT_EQ(buffer.at(0, 0).a, 128);
	EXPECT_EQ(buffer.at(1, 0).a, 128);
}

TEST(BoxBlurTest, RadiusBelowOneChangesNothing)
{
	PixelBuffer buffer = grayRamp();
	boxBlur(buffer, 0.9);
	EXPECT_EQ(buffer, grayRamp());
}

TEST(BoxBlurTest, RejectsNegativeRadius)
{
	PixelBuffer buffer = grayRamp();
	EXPECT_THROW(boxBlur(buffer, -1.0), std::invalid_argument);
}

TEST(AdjustContrastTest, ZeroIsIdentity)
{
	PixelBuffer buffer = grayRamp();
	adjustContrast(buffer, 0.0);
	EXPECT_EQ(buffer, grayRamp());
}

TEST(AdjustContrastTest, MaximumContrastSaturates)
{
	PixelBuffer buffer(3, 1);
	buffer.set(0, 0, {100, 128, 200, 40});

	adjustContrast(buffer, 255.0);

	EXPECT_EQ(buffer.at(0, 0), (Rgba{0, 128, 255, 40}));
}

TEST(AdjustContrastTest, RejectsOutOfRange)
{
	PixelBuffer buffer = grayRamp();
	EXPECT_THROW(adjustContrast(buffer, 259.0), std::invalid_argument);
	EXPECT_THROW(adjustContrast(buffer, -300.0), std::invalid_argument);
}

TEST(AdjustBrightnessTest, ClampsAndKeepsAlpha)
{
	PixelBuffer buffer(2, 1);
	buffer.set(0, 0, {250, 100, 5, 7});
	buffer.set(1, 0, {5, 5, 5, 255});

	adjustBrightness(buffer, 10.0);
	EXPECT_EQ(buffer.at(0, 0), (Rgba{255, 110, 15, 7}));

	adjustBrightness(buffer, -20.0);
	EXPECT_EQ(buffer.at(1, 0), (Rgba{0, 0, 0, 255}));
}

TEST(AdjustBrightnessTest, RejectsNonFiniteBrightness)
{
	PixelBuffer buffer = grayRamp();
	EXPECT_THROW(adjustBrightness(buffer, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
	EXPECT_THROW(adjustBrightness(buffer, std::numeric_limits<double>::infinity()), std::invalid_argument);
	EXPECT_EQ(buffer, grayRamp());
}

TEST(AdjustBrightnessTest, RejectsEmptyBuffer)
{
	PixelBuffer buffer;
	EXPECT_THROW(adjustBrightness(buffer, 10.0), std::invalid_argument);
}

TEST(ApplyPreprocessingTest, DefaultsChangeNothing)
{
	PixelBuffer buffer = grayRamp();
	applyPreprocessing(buffer, {});
	EXPECT_EQ(buffer, grayRamp());
}

TEST(ApplyPreprocessingTest, ContrastRunsBeforeBrightness)
{
	PixelBuffer buffer(1, 1, Rgba{100, 100, 100, 255});

	PreprocessOptions options;
	options.contrast = 255.0;
	options.brightness = 50.0;
	applyPreprocessing(buffer, options);

	EXPECT_EQ(buffer.at(0, 0), (Rgba{50, 50, 50, 255}));
}

TEST(ApplyPreprocessingTest, InvalidLaterSettingLeavesBufferUntouched)
{
	PixelBuffer buffer = grayRamp();

	PreprocessOptions options;
	options.blur = 1.0;
	options.contrast = 300.0;
	EXPECT_THROW(applyPreprocessing(buffer, options), std::invalid_argument);
	EXPECT_EQ(buffer, grayRamp());

	options.contrast = 0.0;
	options.brightness = std::numeric_limits<double>::quiet_NaN();
	EXPECT_THROW(applyPreprocessing(buffer, options), std::invalid_argument);
	EXPECT_EQ(buffer, grayRamp());
}
