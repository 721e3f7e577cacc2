/*
 * PixelForge
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <PixelForge/Vectorizer/BinaryBitmap.hpp>

#include "../Fixture.hpp"

using namespace PixelForge::Vectorizer;
using PixelForge::Imaging::PixelBuffer;
using PixelForge::Imaging::Rgba;

TEST(BinaryBitmapTest, DarkOpaquePixelsAreInk)
{
	PixelBuffer pixels(4, 1, Fixture::WHITE);
	pixels.set(0, 0, Fixture::BLACK);
	pixels.set(1, 0, Rgba{100, 100, 100, 255});
	pixels.set(2, 0, Rgba{200, 200, 200, 255});

	const BinaryBitmap bitmap = BinaryBitmap::fromPixels(pixels, 128);

	EXPECT_TRUE(bitmap.isInk(0, 0));
	EXPECT_TRUE(bitmap.isInk(1, 0));
	EXPECT_FALSE(bitmap.isInk(2, 0));
	EXPECT_FALSE(bitmap.isInk(3, 0));
	EXPECT_EQ(bitmap.countInk(), 2u);
}

TEST(BinaryBitmapTest, ThresholdIsInclusive)
{
	const PixelBuffer pixels(1, 1, Fixture::BLACK);
	EXPECT_TRUE(BinaryBitmap::fromPixels(pixels, 0).isInk(0, 0));
}

TEST(BinaryBitmapTest, TranslucentPixelsAreBackground)
{
	PixelBuffer pixels(2, 1, Fixture::BLACK);
	pixels.setAlpha(0, 0, 127);
	pixels.setAlpha(1, 0, 128);

	const BinaryBitmap bitmap = BinaryBitmap::fromPixels(pixels, 128);

	EXPECT_FALSE(bitmap.isInk(0, 0));
	EXPECT_TRUE(bitmap.isInk(1, 0));
}

TEST(BinaryBitmapTest, OutsideIsNeverInk)
{
	const BinaryBitmap bitmap(2, 2, {1, 1, 1, 1});
	EXPECT_FALSE(bitmap.isInk(-1, 0));
	EXPECT_FALSE(bitmap.isInk(0, 2));
	EXPECT_FALSE(bitmap.isInk(2, 1));
}

TEST(BinaryBitmapTest, BoundaryPixels)
{
	// clang-format off
	const BinaryBitmap bitmap(3, 3, {
		1, 1, 1,
		1, 1, 1,
		1, 1, 0,
	});
	// clang-format on

	EXPECT_TRUE(bitmap.isBoundary(0, 0));
	EXPECT_FALSE(bitmap.isBoundary(1, 1));
	EXPECT_TRUE(bitmap.isBoundary(1, 2));
	EXPECT_FALSE(bitmap.isBoundary(2, 2));
}

TEST(BinaryBitmapTest, RejectsWrongBitCount)
{
	EXPECT_THROW(BinaryBitmap(2, 2, std::vector<std::uint8_t>(3)), std::invalid_argument);
}
